// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Stats.hxx"

DiscoveryMethod
DiscoveryStats::GetMostEffectiveMethod() const noexcept
{
	DiscoveryMethod best = all_discovery_methods[0];
	double best_efficiency = (*this)[best].GetEfficiency();

	for (const auto method : all_discovery_methods) {
		const double efficiency = (*this)[method].GetEfficiency();
		if (efficiency > best_efficiency) {
			best = method;
			best_efficiency = efficiency;
		}
	}

	return best;
}
