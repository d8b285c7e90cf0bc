// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "OptionDef.hxx"

#include <span>
#include <vector>

/**
 * Command line option parser.
 */
class OptionParser
{
	std::span<const OptionDef> options;

	std::span<const char *const> args;

	std::vector<const char *> remaining;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int _argc, const char *const*_argv) noexcept
		:options(_options), args(_argv + 1, _argc - 1) {}

	struct Result {
		int index;
		const char *value;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Parses the next option and advances.  Non-option arguments
	 * are collected for GetRemaining().  Returns a false Result
	 * at the end.
	 *
	 * Throws on error.
	 */
	Result Next();

	std::span<const char *const> GetRemaining() const noexcept {
		return remaining;
	}

private:
	const char *Shift() noexcept {
		const char *s = args.front();
		args = args.subspan(1);
		return s;
	}

	const char *CheckShiftValue(const char *s, const OptionDef &option);
	Result IdentifyOption(const char *s);
};
