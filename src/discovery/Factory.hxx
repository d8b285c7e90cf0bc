// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <memory>
#include <vector>

class Discoverer;
class DiscoveryListener;

/**
 * Creates the set of #Discoverer instances for one discovery run.
 */
class DiscovererFactory {
public:
	virtual ~DiscovererFactory() noexcept = default;

	/**
	 * Throws on error.
	 */
	virtual std::vector<std::unique_ptr<Discoverer>>
	CreateDiscoverers(DiscoveryListener &listener) = 0;
};
