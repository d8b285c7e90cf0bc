// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "net/IPv4Address.hxx"
#include "net/ToString.hxx"
#include "net/LocalNetwork.hxx"

#include <gtest/gtest.h>

TEST(IPv4AddressTest, Basic)
{
	IPv4Address dummy;
	EXPECT_FALSE(dummy.IsDefined());
	EXPECT_EQ(dummy.GetSize(), sizeof(struct sockaddr_in));
}

TEST(IPv4AddressTest, Port)
{
	IPv4Address a(12345);
	EXPECT_TRUE(a.IsDefined());
	EXPECT_EQ(a.GetPort(), 12345u);

	a.SetPort(42);
	EXPECT_EQ(a.GetPort(), 42u);
}

TEST(IPv4AddressTest, NumericAddress)
{
	IPv4Address a(12345);
	EXPECT_EQ(a.GetNumericAddress(), 0u);

	a = IPv4Address(192, 168, 1, 2, 42);
	EXPECT_EQ(a.GetNumericAddress(), 0xc0a80102);
	EXPECT_FALSE(a.IsLoopback());

	EXPECT_TRUE(IPv4Address::Loopback(80).IsLoopback());
}

TEST(IPv4AddressTest, Parse)
{
	auto a = IPv4Address::Parse("192.168.1.42", 1400);
	ASSERT_TRUE(a);
	EXPECT_EQ(a->GetNumericAddress(), 0xc0a8012a);
	EXPECT_EQ(a->GetPort(), 1400u);

	EXPECT_FALSE(IPv4Address::Parse("", 80));
	EXPECT_FALSE(IPv4Address::Parse("192.168.1", 80));
	EXPECT_FALSE(IPv4Address::Parse("192.168.1.256", 80));
	EXPECT_FALSE(IPv4Address::Parse("tv.local", 80));
}

TEST(IPv4AddressTest, ToString)
{
	const IPv4Address a(10, 0, 0, 7, 8009);
	EXPECT_EQ(HostToString(a), "10.0.0.7");
	EXPECT_EQ(ToString(a), "10.0.0.7:8009");
}

TEST(LocalNetworkTest, SubnetHosts)
{
	const auto hosts = ListSubnetHosts(0xc0a801);
	ASSERT_EQ(hosts.size(), 254u);
	EXPECT_EQ(HostToString(hosts.front()), "192.168.1.1");
	EXPECT_EQ(HostToString(hosts.back()), "192.168.1.254");
}

TEST(LocalNetworkTest, InterfaceSubnet)
{
	const std::vector<LocalInterfaceAddress> interfaces{
		{IPv4Address(10, 0, 0, 5, 0), 24},
		{IPv4Address(10, 0, 0, 9, 0), 24},
	};

	/* the interface addresses are excluded, the /24 is listed
	   only once */
	const auto hosts = ListSubnetHosts(interfaces);
	ASSERT_EQ(hosts.size(), 252u);

	for (const auto &i : hosts) {
		EXPECT_NE(i.GetNumericAddress(), 0x0a000005u);
		EXPECT_NE(i.GetNumericAddress(), 0x0a000009u);
	}
}
