// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>

#include <atomic>

#include <stdio.h>
#include <time.h>

using std::string_view_literals::operator""sv;

static std::atomic<LogLevel> log_threshold{LogLevel::NOTICE};

static bool enable_timestamp;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold.store(_threshold, std::memory_order_relaxed);
}

LogLevel
GetLogThreshold() noexcept
{
	return log_threshold.load(std::memory_order_relaxed);
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

LogLevel
ParseLogLevel(std::string_view value)
{
	if (value == "debug"sv)
		return LogLevel::DEBUG;
	else if (value == "info"sv || value == "verbose"sv)
		return LogLevel::INFO;
	else if (value == "notice"sv || value == "default"sv)
		return LogLevel::NOTICE;
	else if (value == "warning"sv)
		return LogLevel::WARNING;
	else if (value == "error"sv)
		return LogLevel::ERROR;
	else
		throw FmtRuntimeError("unknown log level \"{}\"", value);
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	if (enable_timestamp) {
		struct tm tm;
		const time_t t = time(nullptr);
		if (localtime_r(&t, &tm) != nullptr) {
			fmt::print(stderr, "{:%FT%T} {}: {}\n",
				   tm, domain.GetName(),
				   StripRight(message));
			return;
		}
	}

	fmt::print(stderr, "{}: {}\n",
		   domain.GetName(), StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < GetLogThreshold())
		return;

	FileLog(domain, msg);
}
