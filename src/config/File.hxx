// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <istream>

struct ConfigData;

/**
 * Parse configuration from a stream.  The name is only used in error
 * messages.
 *
 * Throws on error.
 */
void
ReadConfigStream(ConfigData &data, std::istream &is, const char *name);

/**
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &data, const char *path);
