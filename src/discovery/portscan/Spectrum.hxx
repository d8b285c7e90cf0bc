// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

/**
 * The curated list of TCP ports which are known to host media
 * control services.
 */
static constexpr const char *DEFAULT_PORT_SPECTRUM =
	"80,443,1400-1410,5000,7000,7100,8008-8099,8200-8205,8873,"
	"9000-9010,10000-10010,49152-49170,50002";

/**
 * Additional ports scanned by the "developer" preset.
 */
static constexpr const char *DEVELOPER_PORT_SPECTRUM =
	"8080,8081,3000,5000";

/**
 * Parse a comma separated list of ports and port ranges
 * (e.g. "80,443,1400-1410").  Duplicates are removed; the order of
 * first appearance is kept.
 *
 * Throws on error.
 */
std::vector<uint16_t>
ParsePortSpectrum(std::string_view s);

/**
 * Append ports which are not yet in the list.
 */
void
MergePortSpectrum(std::vector<uint16_t> &dest,
		  const std::vector<uint16_t> &src) noexcept;
