// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct Device;

/**
 * A (possibly partially) resolved DNS-SD service instance.
 */
struct MdnsServiceRecord {
	/**
	 * The service type without domain, e.g. "_googlecast._tcp".
	 */
	std::string service_type;

	/**
	 * The service instance name, e.g. "Living Room TV".
	 */
	std::string instance_name;

	std::string host_name;

	/**
	 * The numeric IPv4 address; empty if the host name could not
	 * be resolved.
	 */
	std::string address;

	/**
	 * The port from the SRV record; 0 if unknown.
	 */
	uint16_t port = 0;

	/**
	 * The TXT record as key/value pairs (in announcement order).
	 * Keys without "=" have an empty value.
	 */
	std::vector<std::pair<std::string, std::string>> txt;

	[[gnu::pure]]
	const std::string *GetTxt(std::string_view key) const noexcept;

	/**
	 * Parse one TXT string ("key=value") and append it.
	 */
	void AddTxt(std::string_view s) noexcept;
};

/**
 * Convert a resolved service to a #Device.  Missing attributes are
 * replaced with defaults for the service type.
 *
 * @return std::nullopt if the record has no address (the device
 * cannot be identified)
 */
std::optional<Device>
MakeMdnsDevice(const MdnsServiceRecord &record) noexcept;
