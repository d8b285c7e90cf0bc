// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "util/Exception.hxx"

#include <fmt/format.h>

/**
 * Allows passing std::exception_ptr to libfmt; prints the message of
 * the exception and all nested exceptions.
 */
template<>
struct fmt::formatter<std::exception_ptr> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(std::exception_ptr e, FormatContext &ctx) const {
		return formatter<string_view>::format(GetFullMessage(e), ctx);
	}
};
