// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config/File.hxx"
#include "config/Data.hxx"
#include "blast/Config.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

using std::chrono::milliseconds;

static BlastConfig
Load(const char *text)
{
	std::istringstream is(text);
	ConfigData data;
	ReadConfigStream(data, is, "test.conf");
	return LoadBlastConfig(data);
}

TEST(ConfigFile, Defaults)
{
	const auto config = Load("");
	EXPECT_TRUE(config.media_url.empty());
	EXPECT_EQ(config.concurrency, 3u);
	EXPECT_EQ(config.discovery.timeout, milliseconds{4000});
	EXPECT_TRUE(config.discovery.ssdp.enabled);
	EXPECT_EQ(config.discovery.ssdp.mx, 3u);
	EXPECT_EQ(config.discovery.ssdp.search_target, "upnp:rootdevice");
	EXPECT_EQ(config.discovery.ssdp.address, "239.255.255.250");
	EXPECT_EQ(config.discovery.ssdp.port, 1900u);
	EXPECT_TRUE(config.discovery.mdns.enabled);
	EXPECT_EQ(config.discovery.mdns.service_types.size(), 4u);
	EXPECT_TRUE(config.discovery.port_scan.enabled);
	EXPECT_EQ(config.discovery.port_scan.connect_timeout, milliseconds{200});
	EXPECT_EQ(config.discovery.port_scan.max_sockets, 64u);
	EXPECT_EQ(config.control.timeout, milliseconds{5000});
	EXPECT_EQ(config.control.settle_delay, milliseconds{200});
	EXPECT_FALSE(config.control.probe);
}

TEST(ConfigFile, Settings)
{
	const auto config = Load(
		"# a comment\n"
		"media_url \"http://10.0.0.1:8080/media/current.mp3\"\n"
		"concurrency \"5\"\n"
		"discovery_timeout \"3s\"\n"
		"control_timeout \"2500\"\n"
		"settle_delay \"0\"\n"
		"control_probe \"yes\"\n"
		"generic_name_pattern \" at \"\n"
		"generic_name_pattern \"Unknown\"\n"
		"\n"
		"ssdp {\n"
		"  mx \"1\"\n"
		"  search_target \"ssdp:all\"\n"
		"  address \"192.168.7.1\"\n"
		"  port \"1901\"\n"
		"  fetch_description \"no\"\n"
		"}\n"
		"mdns {\n"
		"  service_types \"_googlecast._tcp, _airplay._tcp\"\n"
		"}\n"
		"port_scan {\n"
		"  ports \"1400-1401,8009\"\n"
		"  max_sockets \"8\"\n"
		"  subnet \"192.168.7\"\n"
		"}\n");

	EXPECT_EQ(config.media_url, "http://10.0.0.1:8080/media/current.mp3");
	EXPECT_EQ(config.concurrency, 5u);
	EXPECT_EQ(config.discovery.timeout, milliseconds{3000});
	EXPECT_EQ(config.control.timeout, milliseconds{2500});
	EXPECT_EQ(config.control.settle_delay, milliseconds{0});
	EXPECT_TRUE(config.control.probe);

	EXPECT_EQ(config.discovery.merge.generic_patterns,
		  (std::vector<std::string>{" at ", "Unknown"}));

	EXPECT_EQ(config.discovery.ssdp.mx, 1u);
	EXPECT_EQ(config.discovery.ssdp.search_target, "ssdp:all");
	EXPECT_EQ(config.discovery.ssdp.address, "192.168.7.1");
	EXPECT_EQ(config.discovery.ssdp.port, 1901u);
	EXPECT_FALSE(config.discovery.ssdp.fetch_description);

	EXPECT_EQ(config.discovery.mdns.service_types,
		  (std::vector<std::string>{"_googlecast._tcp", "_airplay._tcp"}));

	EXPECT_EQ(config.discovery.port_scan.ports,
		  (std::vector<uint16_t>{1400, 1401, 8009}));
	EXPECT_EQ(config.discovery.port_scan.max_sockets, 8u);
	EXPECT_EQ(config.discovery.port_scan.subnet, 0xc0a807u);
}

TEST(ConfigFile, Presets)
{
	auto config = Load("preset \"fast\"\n");
	EXPECT_FALSE(config.discovery.port_scan.enabled);
	EXPECT_TRUE(config.discovery.ssdp.enabled);
	EXPECT_EQ(config.discovery.timeout, milliseconds{2000});

	/* explicit settings override the preset */
	config = Load("preset \"developer\"\n"
		      "discovery_timeout \"1000\"\n");
	EXPECT_TRUE(config.discovery.port_scan.enabled);
	EXPECT_EQ(config.discovery.timeout, milliseconds{1000});

	const auto &ports = config.discovery.port_scan.ports;
	EXPECT_NE(std::find(ports.begin(), ports.end(), 3000), ports.end());
	EXPECT_NE(std::find(ports.begin(), ports.end(), 8081), ports.end());
}

TEST(ConfigFile, Override)
{
	/* a setting which is not repeatable: the last one wins */
	const auto config = Load("concurrency \"1\"\nconcurrency \"2\"\n");
	EXPECT_EQ(config.concurrency, 2u);
}

TEST(ConfigFile, Errors)
{
	EXPECT_THROW(Load("no_such_option \"1\"\n"), std::runtime_error);
	EXPECT_THROW(Load("concurrency \"0\"\n"), std::runtime_error);
	EXPECT_THROW(Load("ssdp {\n  mx \"1\"\n"), std::runtime_error);
	EXPECT_THROW(Load("preset \"slow\"\n"), std::runtime_error);
	EXPECT_THROW(Load("port_scan {\n  subnet \"10.0\"\n}\n"),
		     std::runtime_error);
	EXPECT_THROW(Load("ssdp {\n  address \"ssdp.local\"\n}\n"),
		     std::runtime_error);
	EXPECT_THROW(Load("ssdp {\n  port \"70000\"\n}\n"),
		     std::runtime_error);
}

TEST(ConfigFile, ErrorLine)
{
	try {
		Load("\n\nconcurrency \"zero\"\n");
		FAIL();
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find("line 3"), std::string::npos) << msg;
	}
}
