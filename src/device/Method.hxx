// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>

/**
 * The protocol by which a #Device was found.
 */
enum class DiscoveryMethod : uint8_t {
	SSDP,
	MDNS,
	PORT_SCAN,
};

static constexpr unsigned N_DISCOVERY_METHODS = 3;

/**
 * All methods, ordered by decreasing precedence.
 */
static constexpr DiscoveryMethod all_discovery_methods[N_DISCOVERY_METHODS] = {
	DiscoveryMethod::SSDP,
	DiscoveryMethod::MDNS,
	DiscoveryMethod::PORT_SCAN,
};

/**
 * How much do we trust the core fields (name, type, manufacturer)
 * reported by this method?  Higher is better.
 */
constexpr unsigned
GetPrecedence(DiscoveryMethod method) noexcept
{
	switch (method) {
	case DiscoveryMethod::SSDP:
		return 3;

	case DiscoveryMethod::MDNS:
		return 2;

	case DiscoveryMethod::PORT_SCAN:
		break;
	}

	return 1;
}

[[gnu::const]]
const char *
ToString(DiscoveryMethod method) noexcept;
