// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>

/**
 * The phases of a blast.  A run moves forward only; DONE returns to
 * IDLE, and a stop returns to IDLE from everywhere.
 */
enum class BlastState : uint8_t {
	IDLE,

	/**
	 * Waiting for the media server to become ready.
	 */
	SERVING,

	DISCOVERING,

	/**
	 * Sending the clip to the discovered devices.
	 */
	CONTROLLING,

	/**
	 * Finalizing the metrics.
	 */
	SUMMARIZING,

	DONE,
};

[[gnu::const]]
const char *
ToString(BlastState state) noexcept;
