// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LocalNetwork.hxx"
#include "SocketError.hxx"

#include <algorithm>
#include <bit>

#include <ifaddrs.h>
#include <net/if.h>

std::vector<LocalInterfaceAddress>
ListLocalInterfaces()
{
	struct ifaddrs *ifa;
	if (getifaddrs(&ifa) < 0)
		throw MakeSocketError("getifaddrs() failed");

	std::vector<LocalInterfaceAddress> result;

	for (const auto *i = ifa; i != nullptr; i = i->ifa_next) {
		if (i->ifa_addr == nullptr ||
		    i->ifa_addr->sa_family != AF_INET ||
		    (i->ifa_flags & IFF_UP) == 0 ||
		    (i->ifa_flags & IFF_LOOPBACK) != 0)
			continue;

		const IPv4Address address{*reinterpret_cast<const struct sockaddr_in *>(i->ifa_addr)};

		unsigned prefix_length = 24;
		if (i->ifa_netmask != nullptr) {
			const IPv4Address mask{*reinterpret_cast<const struct sockaddr_in *>(i->ifa_netmask)};
			prefix_length = std::popcount(mask.GetNumericAddress());
		}

		result.push_back({address, prefix_length});
	}

	freeifaddrs(ifa);
	return result;
}

static bool
Contains(const std::vector<IPv4Address> &list, uint32_t numeric) noexcept
{
	return std::any_of(list.begin(), list.end(),
			   [numeric](const IPv4Address &i){
				   return i.GetNumericAddress() == numeric;
			   });
}

static void
AppendSubnetHosts(std::vector<IPv4Address> &hosts, uint32_t network24,
		  const std::vector<IPv4Address> &exclude) noexcept
{
	for (uint32_t host = 1; host < 255; ++host) {
		const uint32_t numeric = (network24 << 8) | host;
		if (Contains(exclude, numeric) || Contains(hosts, numeric))
			continue;

		hosts.emplace_back(numeric, 0);
	}
}

std::vector<IPv4Address>
ListSubnetHosts(const std::vector<LocalInterfaceAddress> &interfaces) noexcept
{
	std::vector<IPv4Address> exclude;
	for (const auto &i : interfaces)
		exclude.push_back(i.address);

	std::vector<IPv4Address> hosts;
	for (const auto &i : interfaces)
		AppendSubnetHosts(hosts, i.address.GetNumericAddress() >> 8,
				  exclude);

	return hosts;
}

std::vector<IPv4Address>
ListSubnetHosts(uint32_t network24) noexcept
{
	std::vector<IPv4Address> hosts;
	AppendSubnetHosts(hosts, network24, {});
	return hosts;
}
