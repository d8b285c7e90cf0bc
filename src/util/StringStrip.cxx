// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringStrip.hxx"
#include "ASCII.hxx"

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

std::string_view
StripLeft(std::string_view s) noexcept
{
	std::size_t i = 0;
	while (i < s.size() && IsWhitespaceOrNull(s[i]))
		++i;

	return s.substr(i);
}

std::string_view
StripRight(std::string_view s) noexcept
{
	std::size_t n = s.size();
	while (n > 0 && IsWhitespaceOrNull(s[n - 1]))
		--n;

	return s.substr(0, n);
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
