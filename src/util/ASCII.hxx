// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

constexpr bool
IsWhitespaceOrNull(const char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

constexpr bool
IsWhitespaceNotNull(const char ch) noexcept
{
	return ch > 0 && ch <= 0x20;
}

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

constexpr bool
IsAlphaASCII(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return IsAlphaASCII(ch) || IsDigitASCII(ch);
}

constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? char(ch - 'A' + 'a')
		: ch;
}

/**
 * Compare two strings, ignoring case for ASCII letters.  This is
 * locale independent, unlike strcasecmp().
 */
[[gnu::pure]]
inline bool
StringEqualsCaseASCII(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(),
			   [](char x, char y){
				   return ToLowerASCII(x) == ToLowerASCII(y);
			   });
}

[[gnu::pure]]
inline bool
StringStartsWithCaseASCII(std::string_view haystack,
			  std::string_view needle) noexcept
{
	return haystack.size() >= needle.size() &&
		StringEqualsCaseASCII(haystack.substr(0, needle.size()),
				      needle);
}

[[gnu::pure]]
inline bool
StringContainsCaseASCII(std::string_view haystack,
			std::string_view needle) noexcept
{
	if (needle.empty())
		return true;

	return std::search(haystack.begin(), haystack.end(),
			   needle.begin(), needle.end(),
			   [](char x, char y){
				   return ToLowerASCII(x) == ToLowerASCII(y);
			   }) != haystack.end();
}

inline std::string
ToLowerASCII(std::string_view s) noexcept
{
	std::string result;
	result.reserve(s.size());
	for (char ch : s)
		result.push_back(ToLowerASCII(ch));
	return result;
}
