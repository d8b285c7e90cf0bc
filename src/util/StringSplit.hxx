// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>
#include <utility>

/**
 * Split the string at the first occurrence of the given character.
 * If the character is not found, then the first value is the whole
 * string and the second value is a null std::string_view.
 */
constexpr std::pair<std::string_view, std::string_view>
Split(const std::string_view haystack, const char ch) noexcept
{
	const auto i = haystack.find(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Split the string at the last occurrence of the given character.
 * If the character is not found, then the first value is the whole
 * string and the second value is a null std::string_view.
 */
constexpr std::pair<std::string_view, std::string_view>
SplitLast(const std::string_view haystack, const char ch) noexcept
{
	const auto i = haystack.rfind(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Invoke a function for each non-empty whitespace-stripped segment
 * of a string separated by the given character.
 */
template<typename F>
void
ForEachSplit(std::string_view s, const char separator, F &&f)
{
	while (s.data() != nullptr) {
		auto [segment, rest] = Split(s, separator);

		while (!segment.empty() &&
		       (segment.front() == ' ' || segment.front() == '\t'))
			segment.remove_prefix(1);
		while (!segment.empty() &&
		       (segment.back() == ' ' || segment.back() == '\t'))
			segment.remove_suffix(1);

		if (!segment.empty())
			f(segment);

		s = rest;
	}
}
