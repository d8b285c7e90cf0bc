// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>
#include <string_view>
#include <vector>

struct Device;

/**
 * Rules for combining two records of the same device.
 */
struct MergePolicy {
	/**
	 * A friendly name containing one of these substrings is
	 * considered "generic", i.e. generated by us instead of
	 * announced by the device.
	 */
	std::vector<std::string> generic_patterns{" at "};

	[[gnu::pure]]
	bool IsGenericName(std::string_view name) const noexcept;

	/**
	 * Shall the core fields of #existing be replaced by the ones
	 * of #incoming?
	 */
	[[gnu::pure]]
	bool ShouldReplaceCore(const Device &existing,
			       const Device &incoming) const noexcept;
};

/**
 * Merge #incoming into #existing (both have the same key).  The core
 * fields are replaced according to the #MergePolicy, the metadata
 * maps are always united, and values from #incoming win.
 *
 * @return true if #existing was modified
 */
bool
MergeDevice(Device &existing, const Device &incoming,
	    const MergePolicy &policy) noexcept;
