// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstdint>
#include <string_view>

/**
 * Returns the scheme name of the specified URI, or an empty string.
 */
[[gnu::pure]]
std::string_view
uri_get_scheme(std::string_view uri) noexcept;

/**
 * Returns the "authority" part ("host:port") of the specified URI or
 * an empty string.  User information ("user@") is removed.
 */
[[gnu::pure]]
std::string_view
uri_get_host_and_port(std::string_view uri) noexcept;

/**
 * Returns the host name of the URI (without port) or an empty string.
 */
[[gnu::pure]]
std::string_view
uri_get_host(std::string_view uri) noexcept;

/**
 * Returns the explicit port number of the URI or 0 if there is none
 * (or if it is malformed).
 */
[[gnu::pure]]
uint16_t
uri_get_port(std::string_view uri) noexcept;

/**
 * Returns the URI path (including the query string) or an empty
 * string if the given URI has no path.  For relative URIs, the URI
 * itself is returned.
 */
[[gnu::pure]]
std::string_view
uri_get_path(std::string_view uri) noexcept;
