// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "discovery/mdns/Record.hxx"
#include "device/Device.hxx"

#include <gtest/gtest.h>

TEST(MdnsRecord, Txt)
{
	MdnsServiceRecord record;
	record.AddTxt("fn=Living Room TV");
	record.AddTxt("md=Chromecast Ultra");
	record.AddTxt("flag");
	record.AddTxt("url=http://x/?a=b");

	ASSERT_EQ(record.txt.size(), 4u);
	ASSERT_NE(record.GetTxt("FN"), nullptr);
	EXPECT_EQ(*record.GetTxt("fn"), "Living Room TV");
	EXPECT_EQ(*record.GetTxt("flag"), "");
	EXPECT_EQ(*record.GetTxt("url"), "http://x/?a=b");
	EXPECT_EQ(record.GetTxt("id"), nullptr);
}

TEST(MdnsRecord, Chromecast)
{
	MdnsServiceRecord record;
	record.service_type = "_googlecast._tcp";
	record.instance_name = "Chromecast-Ultra-0123456789abcdef";
	record.host_name = "0123456789abcdef.local";
	record.address = "192.168.1.30";
	record.port = 8009;
	record.AddTxt("id=0123456789abcdef");
	record.AddTxt("md=Chromecast Ultra");
	record.AddTxt("fn=Living Room TV");

	const auto device = MakeMdnsDevice(record);
	ASSERT_TRUE(device);
	EXPECT_EQ(device->ip_address, "192.168.1.30");
	EXPECT_EQ(device->port, 8009u);
	EXPECT_EQ(device->method, DiscoveryMethod::MDNS);
	EXPECT_EQ(device->friendly_name, "Living Room TV");
	EXPECT_EQ(device->model_name, "Chromecast Ultra");
	EXPECT_EQ(device->manufacturer, "Google");
	EXPECT_EQ(device->uuid, "0123456789abcdef");
	EXPECT_EQ(device->control_url, "/apps");
	EXPECT_EQ(std::get<KnownClass>(device->classification).kind,
		  "Chromecast");

	EXPECT_EQ(*device->GetMetadata("mdns.service"), "_googlecast._tcp");
	EXPECT_EQ(*device->GetMetadata("mdns.host"), "0123456789abcdef.local");
	EXPECT_EQ(*device->GetMetadata("mdns.md"), "Chromecast Ultra");
}

TEST(MdnsRecord, AirPlay)
{
	MdnsServiceRecord record;
	record.service_type = "_airplay._tcp";
	record.instance_name = "Bedroom";
	record.address = "192.168.1.31";
	record.port = 7000;
	record.AddTxt("am=AppleTV6,2");

	const auto device = MakeMdnsDevice(record);
	ASSERT_TRUE(device);
	EXPECT_EQ(device->friendly_name, "Bedroom");
	EXPECT_EQ(device->model_name, "AppleTV6,2");
	EXPECT_EQ(device->manufacturer, "Apple");
}

TEST(MdnsRecord, DefaultPort)
{
	MdnsServiceRecord record;
	record.service_type = "_dlna._tcp";
	record.address = "192.168.1.32";

	const auto device = MakeMdnsDevice(record);
	ASSERT_TRUE(device);
	EXPECT_EQ(device->port, 80u);
	EXPECT_EQ(device->control_url, "/MediaRenderer/AVTransport/Control");
	EXPECT_EQ(device->friendly_name, "DLNA renderer at 192.168.1.32");
}

TEST(MdnsRecord, UnknownService)
{
	MdnsServiceRecord record;
	record.service_type = "_http._tcp";
	record.instance_name = "Printer";
	record.address = "192.168.1.33";
	record.port = 631;

	const auto device = MakeMdnsDevice(record);
	ASSERT_TRUE(device);
	EXPECT_EQ(device->friendly_name, "Printer");
	EXPECT_TRUE(device->manufacturer.empty());
	EXPECT_TRUE(std::holds_alternative<UnknownClass>(device->classification));
}

TEST(MdnsRecord, NoAddress)
{
	MdnsServiceRecord record;
	record.service_type = "_googlecast._tcp";
	record.instance_name = "Chromecast";
	record.port = 8009;

	EXPECT_FALSE(MakeMdnsDevice(record));
}

/**
 * A resolver which had to give up on the TXT record still yields a
 * device named after the service instance.
 */
TEST(MdnsRecord, NoTxt)
{
	MdnsServiceRecord record;
	record.service_type = "_googlecast._tcp";
	record.instance_name = "Chromecast-0123456789abcdef";
	record.host_name = "0123456789abcdef.local";
	record.address = "192.168.1.34";
	record.port = 8009;

	const auto device = MakeMdnsDevice(record);
	ASSERT_TRUE(device);
	EXPECT_TRUE(record.txt.empty());
	EXPECT_EQ(device->ip_address, "192.168.1.34");
	EXPECT_EQ(device->port, 8009u);
	EXPECT_EQ(device->friendly_name, "Chromecast-0123456789abcdef");
	EXPECT_EQ(device->manufacturer, "Google");
	EXPECT_EQ(device->control_url, "/apps");
	EXPECT_TRUE(device->model_name.empty());
	EXPECT_TRUE(device->uuid.empty());
	EXPECT_EQ(std::get<KnownClass>(device->classification).kind,
		  "Chromecast");
}
