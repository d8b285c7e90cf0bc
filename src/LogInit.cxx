// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"

#include <stdio.h>

void
log_early_init(bool verbose) noexcept
{
	/* force stderr to be line-buffered */
	setvbuf(stderr, nullptr, _IOLBF, 0);

	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
}

void
log_init(const ConfigData &config, bool verbose)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
			return s != nullptr
				? ParseLogLevel(s)
				: LogLevel::NOTICE;
		}));

	if (config.GetBool(ConfigOption::LOG_TIMESTAMP, false))
		EnableLogTimestamp();
}
