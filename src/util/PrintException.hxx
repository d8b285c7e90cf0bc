// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <exception>

/**
 * Print this exception (and its nested exceptions, one per line) to
 * stderr.
 */
void
PrintException(const std::exception_ptr &ep) noexcept;
