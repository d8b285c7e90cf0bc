// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct Device;

static constexpr const char *SSDP_MULTICAST_ADDRESS = "239.255.255.250";
static constexpr uint16_t SSDP_PORT = 1900;

/**
 * Build the M-SEARCH request datagram.
 */
std::string
BuildSsdpSearch(std::string_view search_target, unsigned mx) noexcept;

/**
 * The interesting headers of an SSDP search response.
 */
struct SsdpResponse {
	std::string location;
	std::string server;
	std::string st;
	std::string usn;
};

/**
 * Parse an SSDP search response datagram.  Returns std::nullopt if
 * this is not a successful ("200") HTTP response.
 */
[[gnu::pure]]
std::optional<SsdpResponse>
ParseSsdpResponse(std::string_view datagram) noexcept;

/**
 * Build a provisional #Device from an SSDP response, using
 * heuristics for all fields which are not in the response.
 *
 * @param sender_ip the address the response was received from; it
 * is used if the LOCATION header does not contain a numeric address
 */
Device
MakeSsdpDevice(const SsdpResponse &response,
	       std::string_view sender_ip) noexcept;
