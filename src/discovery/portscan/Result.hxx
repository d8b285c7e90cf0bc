// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

struct Device;

/**
 * Build a #Device for an open TCP port, guessing its kind from the
 * port number.
 */
Device
MakePortScanDevice(std::string_view ip, uint16_t port) noexcept;

/**
 * Reorder the ports so that ports with a known renderer kind are
 * probed first; the relative order is kept otherwise.
 */
void
PrioritizeKnownPorts(std::vector<uint16_t> &ports) noexcept;
