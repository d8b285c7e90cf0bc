// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "device/Method.hxx"

#include <array>
#include <chrono>

/**
 * Counters of one #DiscoveryMethod in one discovery run.
 */
struct DiscoveryMethodStats {
	/**
	 * Was this method started at all?
	 */
	bool enabled = false;

	/**
	 * Did the method fail with a resource error?
	 */
	bool failed = false;

	/**
	 * The number of distinct devices (by address and port)
	 * which were first reported by this method.
	 */
	unsigned devices_found = 0;

	/**
	 * The time this method was active (until it finished or the
	 * deadline expired).
	 */
	std::chrono::milliseconds duration{};

	/**
	 * Devices per second.
	 */
	[[gnu::pure]]
	double GetEfficiency() const noexcept {
		if (duration.count() <= 0)
			return 0;

		return devices_found * 1000.0 / duration.count();
	}
};

struct DiscoveryStats {
	std::array<DiscoveryMethodStats, N_DISCOVERY_METHODS> methods;

	auto &operator[](DiscoveryMethod method) noexcept {
		return methods[std::size_t(method)];
	}

	const auto &operator[](DiscoveryMethod method) const noexcept {
		return methods[std::size_t(method)];
	}

	[[gnu::pure]]
	unsigned GetTotalDevices() const noexcept {
		unsigned n = 0;
		for (const auto &i : methods)
			n += i.devices_found;
		return n;
	}

	/**
	 * The method with the highest efficiency; ties are resolved
	 * in precedence order (SSDP, mDNS, port scan).
	 */
	[[gnu::pure]]
	DiscoveryMethod GetMostEffectiveMethod() const noexcept;
};
