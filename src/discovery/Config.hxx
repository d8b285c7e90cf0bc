// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "device/Merge.hxx"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct ConfigData;

enum class DiscoveryPreset {
	/**
	 * SSDP and mDNS only, short deadline.
	 */
	FAST,

	/**
	 * All methods.
	 */
	COMPREHENSIVE,

	/**
	 * All methods, long deadline, common development server
	 * ports.
	 */
	DEVELOPER,
};

/**
 * Throws on error.
 */
DiscoveryPreset
ParseDiscoveryPreset(const char *s);

struct SsdpConfig {
	bool enabled = true;

	/**
	 * The "MX" header: the maximum number of seconds a device
	 * may wait before responding.
	 */
	unsigned mx = 3;

	std::string search_target = "upnp:rootdevice";

	/**
	 * Where M-SEARCH requests are sent to; the SSDP multicast
	 * group unless configured otherwise.
	 */
	std::string address = "239.255.255.250";
	uint16_t port = 1900;

	/**
	 * Download the description document announced in the
	 * LOCATION header?
	 */
	bool fetch_description = true;

	std::chrono::milliseconds description_timeout{5000};
};

struct MdnsConfig {
	bool enabled = true;

	std::vector<std::string> service_types{
		"_googlecast._tcp",
		"_airplay._tcp",
		"_raop._tcp",
		"_dlna._tcp",
	};
};

struct PortScanConfig {
	bool enabled = true;

	std::vector<uint16_t> ports;

	std::chrono::milliseconds connect_timeout{200};

	/**
	 * The maximum number of concurrent connect attempts.
	 */
	unsigned max_sockets = 64;

	/**
	 * Scan this /24 network (three leading octets in host byte
	 * order) instead of the networks of the local interfaces.
	 * 0 means not set.
	 */
	uint32_t subnet = 0;

	PortScanConfig();
};

struct DiscoveryConfig {
	std::chrono::milliseconds timeout{4000};

	SsdpConfig ssdp;
	MdnsConfig mdns;
	PortScanConfig port_scan;

	MergePolicy merge;

	void ApplyPreset(DiscoveryPreset preset);

	[[gnu::pure]]
	bool IsAnyEnabled() const noexcept {
		return ssdp.enabled || mdns.enabled || port_scan.enabled;
	}
};

/**
 * Parse "a.b.c" into the three leading octets of a /24 network.
 *
 * Throws on error.
 */
uint32_t
ParseSubnet24(const char *s);

/**
 * Load the discovery settings from the configuration file: first the
 * preset, then the explicit settings.
 *
 * Throws on error.
 */
DiscoveryConfig
LoadDiscoveryConfig(const ConfigData &config);
