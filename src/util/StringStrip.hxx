// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

/**
 * Skip whitespace at the beginning of the string.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
const char *
StripLeft(const char *p) noexcept;

[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
static inline char *
StripLeft(char *p) noexcept
{
	return const_cast<char *>(StripLeft((const char *)p));
}

[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

/**
 * Remove whitespace from both ends.
 */
[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;
