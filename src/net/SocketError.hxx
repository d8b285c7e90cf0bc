// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cerrno>
#include <system_error>

using socket_error_t = int;

[[gnu::pure]]
static inline socket_error_t
GetSocketError() noexcept
{
	return errno;
}

constexpr bool
IsSocketErrorConnectWouldBlock(socket_error_t code) noexcept
{
	/* on Linux, EAGAIN==EWOULDBLOCK is for local sockets and
	   EINPROGRESS is for all other sockets */
	return code == EINPROGRESS || code == EWOULDBLOCK;
}

constexpr bool
IsSocketErrorReceiveWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

[[gnu::const]]
static inline std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept
{
	return std::system_error(code, std::system_category(), msg);
}

[[gnu::pure]]
static inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}
