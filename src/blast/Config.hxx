// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "discovery/Config.hxx"
#include "control/Client.hxx"

#include <string>

struct ConfigData;

struct BlastConfig {
	/**
	 * The URL of the clip; empty if none was configured.
	 */
	std::string media_url;

	/**
	 * The maximum number of simultaneous control attempts.
	 */
	unsigned concurrency = 3;

	DiscoveryConfig discovery;

	ControlConfig control;
};

/**
 * Throws on error.
 */
BlastConfig
LoadBlastConfig(const ConfigData &config);
