// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "LogLevel.hxx"

#include <string_view>

void
SetLogThreshold(LogLevel _threshold) noexcept;

[[gnu::pure]]
LogLevel
GetLogThreshold() noexcept;

void
EnableLogTimestamp() noexcept;

/**
 * Parse a log level name ("debug", "info", "notice", "warning",
 * "error"; "verbose" is an alias for "info" and "default" for
 * "notice").
 *
 * Throws std::runtime_error on error.
 */
LogLevel
ParseLogLevel(std::string_view value);
