// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "IPv4Address.hxx"

#include <cstdint>
#include <vector>

/**
 * An IPv4 address configured on a local interface which is up and
 * not a loopback interface.
 */
struct LocalInterfaceAddress {
	IPv4Address address;

	/**
	 * The network prefix length (e.g. 24 for a /24).
	 */
	unsigned prefix_length;
};

/**
 * Enumerate the IPv4 addresses of all local non-loopback interfaces.
 *
 * Throws std::system_error on error.
 */
std::vector<LocalInterfaceAddress>
ListLocalInterfaces();

/**
 * Build the list of host candidates on the /24 of each given
 * interface address (hosts .1 to .254), excluding the interface
 * address itself and duplicates.  Larger networks are scanned only
 * in the /24 containing the interface address.
 */
std::vector<IPv4Address>
ListSubnetHosts(const std::vector<LocalInterfaceAddress> &interfaces) noexcept;

/**
 * Same as ListSubnetHosts(), but for an explicit network given as
 * the three leading octets in host byte order (e.g. 0xc0a801 for
 * 192.168.1.x).
 */
std::vector<IPv4Address>
ListSubnetHosts(uint32_t network24) noexcept;
