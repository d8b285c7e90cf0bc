// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <chrono>
#include <optional>

struct ConfigData;

struct CommandLineOptions {
	const char *media_url = nullptr;

	/**
	 * "IP:PORT" of a single device to be blasted without
	 * discovery.
	 */
	const char *device = nullptr;

	std::optional<std::chrono::milliseconds> discovery_timeout;

	unsigned concurrency = 0;

	bool discover_only = false;

	bool verbose = false;
};

/**
 * Parse the command line and load the configuration file (if one
 * was specified) into #config.
 *
 * Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config);
