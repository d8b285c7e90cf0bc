// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string_view>

inline const char *
OptionParser::CheckShiftValue(const char *s, const OptionDef &option)
{
	if (!option.HasValue())
		return nullptr;

	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", s);

	return Shift();
}

inline OptionParser::Result
OptionParser::IdentifyOption(const char *s)
{
	if (s[1] == '-') {
		const std::string_view arg{s + 2};

		for (const auto &i : options) {
			const std::string_view name{i.GetLongOption()};
			if (!arg.starts_with(name))
				continue;

			const auto t = arg.substr(name.size());
			const char *value;

			if (t.empty())
				value = CheckShiftValue(s, i);
			else if (t.front() == '=' && i.HasValue())
				value = t.data() + 1;
			else
				continue;

			return {int(&i - options.data()), value};
		}
	} else if (s[1] != 0 && s[2] == 0) {
		const char ch = s[1];
		for (const auto &i : options) {
			if (i.HasShortOption() && ch == i.GetShortOption()) {
				const char *value = CheckShiftValue(s, i);
				return {int(&i - options.data()), value};
			}
		}
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = Shift();
		if (arg[0] == '-' && arg[1] != 0)
			return IdentifyOption(arg);

		remaining.push_back(arg);
	}

	return {-1, nullptr};
}
