// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

struct ConfigData;

/**
 * Configure the logging library before the configuration file has
 * been loaded.
 */
void
log_early_init(bool verbose) noexcept;

/**
 * Throws #std::runtime_error on error.
 */
void
log_init(const ConfigData &config, bool verbose);
