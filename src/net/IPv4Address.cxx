// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "IPv4Address.hxx"

#include <string>

#include <arpa/inet.h>

std::optional<IPv4Address>
IPv4Address::Parse(std::string_view host, uint16_t port) noexcept
{
	if (host.empty() || host.size() > 15)
		return std::nullopt;

	/* inet_pton() needs a null-terminated string */
	const std::string buffer{host};

	struct sockaddr_in sin{};
	sin.sin_family = AF_INET;
	sin.sin_port = htons(port);
	if (inet_pton(AF_INET, buffer.c_str(), &sin.sin_addr) != 1)
		return std::nullopt;

	return IPv4Address{sin};
}
