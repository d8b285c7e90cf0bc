// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * Control URLs which are known to work with certain renderers.
 */
namespace ControlUrl {
static constexpr const char *SONOS = "/MediaRenderer/AVTransport/Control";
static constexpr const char *UPNP = "/upnp/control/AVTransport1";
static constexpr const char *CAST = "/apps";
}

/**
 * What we can guess about a renderer from a few strings.
 */
struct KindHint {
	/**
	 * A short identifier, e.g. "Sonos".
	 */
	const char *kind;

	/**
	 * The first part of a generated friendly name, e.g. "Sonos
	 * Speaker".
	 */
	const char *base_name;

	/**
	 * The manufacturer or nullptr if unknown.
	 */
	const char *manufacturer;

	/**
	 * The AVTransport control URL to try.
	 */
	const char *control_url;
};

/**
 * Classify an SSDP response by looking at substrings of its SERVER,
 * USN and LOCATION headers.  Never returns nullptr; the last table
 * entry is a generic UPnP device.
 */
[[gnu::pure]] [[gnu::returns_nonnull]]
const KindHint *
ClassifySsdp(std::string_view server, std::string_view usn,
	     std::string_view location) noexcept;

/**
 * Does this hint describe the generic fallback, i.e. nothing was
 * recognized?
 */
[[gnu::pure]]
bool
IsGenericSsdpHint(const KindHint &hint) noexcept;

/**
 * Guess the manufacturer from a SERVER header.  Returns an empty
 * string if the header is empty.
 */
[[gnu::pure]]
std::string
ManufacturerFromServer(std::string_view server) noexcept;

/**
 * Look up a port number in the table of well-known renderer ports.
 *
 * @return nullptr if the port is not known
 */
[[gnu::const]]
const KindHint *
ClassifyPort(uint16_t port) noexcept;

/**
 * Build a name like "Sonos Speaker at 192.168.1.5".
 */
std::string
MakeGenericName(const char *base_name, std::string_view ip) noexcept;

/**
 * Build a name like "Device at 192.168.1.5:8080".
 */
std::string
MakeGenericName(const char *base_name, std::string_view ip,
		uint16_t port) noexcept;
