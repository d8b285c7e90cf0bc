// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>

#include <sys/types.h>

class IPv4Address;

/**
 * An OO wrapper for a socket file descriptor.  This class does not
 * own the descriptor; see #UniqueSocketDescriptor.
 */
class SocketDescriptor {
	int fd;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool operator==(SocketDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(-1);
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	constexpr int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	constexpr void SetUndefined() noexcept {
		fd = -1;
	}

	void Close() noexcept;

	/**
	 * Create a non-blocking socket with close-on-exec.
	 *
	 * @return false on error (errno is set)
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	/**
	 * Returns the pending error (SO_ERROR), e.g. the result of a
	 * non-blocking connect().
	 */
	[[gnu::pure]]
	int GetError() const noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetIntOption(int level, int name,
			  const int &value) const noexcept {
		return SetOption(level, name, &value, sizeof(value));
	}

	bool SetBoolOption(int level, int name, bool value) const noexcept {
		return SetIntOption(level, name, value);
	}

	bool SetReuseAddress(bool value=true) const noexcept;

	/**
	 * Join the IPv4 multicast group on all interfaces.
	 */
	bool AddMembership(const IPv4Address &group) const noexcept;

	bool SetMulticastTtl(int ttl) const noexcept;

	bool Bind(const IPv4Address &address) const noexcept;

	bool Listen(int backlog) const noexcept;

	SocketDescriptor AcceptNonBlock() const noexcept;

	/**
	 * Start connecting.  On a non-blocking socket this usually
	 * fails with EINPROGRESS; see IsSocketErrorConnectWouldBlock().
	 */
	bool Connect(const IPv4Address &address) const noexcept;

	/**
	 * Returns the locally bound address; useful after binding to
	 * port 0.
	 */
	[[gnu::pure]]
	IPv4Address GetLocalAddress() const noexcept;

	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept;
	ssize_t Send(std::span<const std::byte> src, int flags=0) const noexcept;

	/**
	 * Receive a datagram and its source address.
	 */
	ssize_t ReadFrom(std::span<std::byte> dest,
			 IPv4Address &address) const noexcept;

	/**
	 * Send a datagram to the given address.
	 */
	ssize_t WriteTo(std::span<const std::byte> src,
			const IPv4Address &address) const noexcept;

	void ShutdownWrite() const noexcept;
};

static_assert(std::is_trivial<SocketDescriptor>::value, "type is not trivial");
