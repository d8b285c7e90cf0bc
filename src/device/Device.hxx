// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Method.hxx"

#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

/**
 * Nothing is known about what kind of device this is.
 */
struct UnknownClass {
	bool operator==(const UnknownClass &) const noexcept = default;
};

/**
 * The kind of device was guessed from indirect evidence (a port
 * number, a substring in a server header).
 */
struct HeuristicClass {
	std::string kind;

	/**
	 * A short human-readable description of the evidence,
	 * e.g. "port 1400".
	 */
	std::string evidence;

	bool operator==(const HeuristicClass &) const noexcept = default;
};

/**
 * The device described itself (description document, mDNS service
 * type).
 */
struct KnownClass {
	std::string kind;

	bool operator==(const KnownClass &) const noexcept = default;
};

using DeviceClass = std::variant<UnknownClass, HeuristicClass, KnownClass>;

/**
 * Returns the "kind" string of a classification or an empty string
 * for #UnknownClass.
 */
[[gnu::pure]]
std::string_view
GetKind(const DeviceClass &c) noexcept;

/**
 * The identity of a device for deduplication: address and port.
 */
struct DeviceKey {
	std::string ip;
	uint16_t port = 0;

	auto operator<=>(const DeviceKey &) const noexcept = default;
	bool operator==(const DeviceKey &) const noexcept = default;
};

/**
 * Format as "IP:PORT".
 */
[[gnu::pure]]
std::string
ToString(const DeviceKey &key) noexcept;

/**
 * Parse "IP:PORT".
 *
 * Throws on error.
 */
DeviceKey
ParseDeviceKey(std::string_view s);

using DeviceMetadata = std::map<std::string, std::string, std::less<>>;

/**
 * A media renderer found on the local network.
 */
struct Device {
	static constexpr const char *DEFAULT_CONTROL_URL = "/AVTransport/control";

	std::string ip_address;
	uint16_t port = 0;

	/**
	 * The UPnP device type URN (or another protocol-specific
	 * type string); may be empty.
	 */
	std::string device_type;

	std::string friendly_name;
	std::string manufacturer;
	std::string model_name;

	/**
	 * The path where AVTransport SOAP actions are POSTed.
	 */
	std::string control_url = DEFAULT_CONTROL_URL;

	/**
	 * A stable identity if the device announced one.
	 */
	std::string uuid;

	DiscoveryMethod method = DiscoveryMethod::PORT_SCAN;

	/**
	 * Additional fields collected by the discoverers.  Keys are
	 * prefixed with their source ("ssdp.", "xml.", "mdns.",
	 * "port_scan.").
	 */
	DeviceMetadata metadata;

	DeviceClass classification;

	Device() = default;

	Device(std::string_view _ip, uint16_t _port,
	       DiscoveryMethod _method) noexcept
		:ip_address(_ip), port(_port), method(_method) {}

	DeviceKey GetKey() const noexcept {
		return {ip_address, port};
	}

	bool operator==(const Device &) const noexcept = default;

	/**
	 * Returns the metadata value or nullptr.
	 */
	[[gnu::pure]]
	const std::string *GetMetadata(std::string_view key) const noexcept {
		auto i = metadata.find(key);
		return i != metadata.end() ? &i->second : nullptr;
	}

	void SetMetadata(std::string_view key, std::string_view value) noexcept {
		metadata.insert_or_assign(std::string{key}, std::string{value});
	}

	/**
	 * A name for log messages.
	 */
	[[gnu::pure]]
	std::string GetDisplayName() const noexcept;
};

/**
 * Per-device progress as shown to observers.
 */
enum class DeviceStatus : uint8_t {
	DISCOVERED,
	CONNECTING,
	SUCCESS,
	FAILED,
};

[[gnu::const]]
const char *
ToString(DeviceStatus status) noexcept;
