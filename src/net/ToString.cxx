// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "ToString.hxx"
#include "IPv4Address.hxx"

#include <fmt/format.h>

#include <arpa/inet.h>

std::string
HostToString(const IPv4Address &address) noexcept
{
	char buffer[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &address.GetAddress(),
		      buffer, sizeof(buffer)) == nullptr)
		return {};

	return buffer;
}

std::string
ToString(const IPv4Address &address) noexcept
{
	return fmt::format("{}:{}", HostToString(address),
			   address.GetPort());
}
