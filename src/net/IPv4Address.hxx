// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <netinet/in.h>
#include <sys/socket.h>

/**
 * An OO wrapper for struct sockaddr_in.
 */
class IPv4Address {
	struct sockaddr_in address;

	static constexpr struct sockaddr_in Construct(uint32_t host_order,
						      uint16_t port) noexcept {
		struct sockaddr_in sin{};
		sin.sin_family = AF_INET;
		sin.sin_port = __builtin_bswap16(port);
		sin.sin_addr.s_addr = __builtin_bswap32(host_order);
		return sin;
	}

public:
	constexpr IPv4Address() noexcept
		:address() {}

	constexpr IPv4Address(const struct sockaddr_in &_address) noexcept
		:address(_address) {}

	/**
	 * @param host_order the address in host byte order
	 */
	constexpr IPv4Address(uint32_t host_order, uint16_t port) noexcept
		:address(Construct(host_order, port)) {}

	constexpr IPv4Address(uint8_t a, uint8_t b, uint8_t c,
			      uint8_t d, uint16_t port) noexcept
		:IPv4Address((uint32_t(a) << 24) | (uint32_t(b) << 16) |
			     (uint32_t(c) << 8) | uint32_t(d), port) {}

	/**
	 * The "any" address with the given port.
	 */
	constexpr explicit IPv4Address(uint16_t port) noexcept
		:IPv4Address(uint32_t(INADDR_ANY), port) {}

	static constexpr IPv4Address Loopback(uint16_t port) noexcept {
		return IPv4Address(uint32_t(INADDR_LOOPBACK), port);
	}

	/**
	 * Parse a dotted-quad string.  Returns std::nullopt if the
	 * string is not a valid IPv4 address.
	 */
	[[gnu::pure]]
	static std::optional<IPv4Address> Parse(std::string_view host,
						uint16_t port) noexcept;

	constexpr bool IsDefined() const noexcept {
		return address.sin_family == AF_INET;
	}

	const struct sockaddr *GetSockaddr() const noexcept {
		return reinterpret_cast<const struct sockaddr *>(&address);
	}

	constexpr socklen_t GetSize() const noexcept {
		return sizeof(address);
	}

	constexpr uint16_t GetPort() const noexcept {
		return __builtin_bswap16(address.sin_port);
	}

	void SetPort(uint16_t port) noexcept {
		address.sin_port = __builtin_bswap16(port);
	}

	constexpr const struct in_addr &GetAddress() const noexcept {
		return address.sin_addr;
	}

	/**
	 * @return the address in host byte order
	 */
	constexpr uint32_t GetNumericAddress() const noexcept {
		return __builtin_bswap32(address.sin_addr.s_addr);
	}

	constexpr bool IsLoopback() const noexcept {
		return (GetNumericAddress() >> 24) == 127;
	}
};
