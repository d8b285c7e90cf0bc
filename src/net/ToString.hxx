// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string>

class IPv4Address;

/**
 * Converts the address (without the port) to a dotted-quad string.
 */
[[gnu::pure]]
std::string
HostToString(const IPv4Address &address) noexcept;

/**
 * Converts the address to "a.b.c.d:port".
 */
[[gnu::pure]]
std::string
ToString(const IPv4Address &address) noexcept;
