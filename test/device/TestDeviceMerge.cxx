// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "device/Device.hxx"
#include "device/Merge.hxx"

#include <gtest/gtest.h>

static Device
MakeDevice(DiscoveryMethod method, const char *name)
{
	Device device("192.168.1.20", 1400, method);
	device.friendly_name = name;
	return device;
}

TEST(DeviceMerge, GenericName)
{
	const MergePolicy policy;
	EXPECT_TRUE(policy.IsGenericName(""));
	EXPECT_TRUE(policy.IsGenericName("Sonos Speaker at 192.168.1.20"));
	EXPECT_FALSE(policy.IsGenericName("Living Room"));

	MergePolicy custom;
	custom.generic_patterns = {"Unknown", " at "};
	EXPECT_TRUE(custom.IsGenericName("Unknown renderer"));
}

TEST(DeviceMerge, SsdpBeatsPortScan)
{
	const MergePolicy policy;

	Device existing = MakeDevice(DiscoveryMethod::PORT_SCAN,
				     "Sonos Speaker at 192.168.1.20");
	existing.SetMetadata("port_scan.port", "1400");
	existing.classification = HeuristicClass{"Sonos", "port 1400"};

	Device incoming = MakeDevice(DiscoveryMethod::SSDP, "Kitchen");
	incoming.manufacturer = "Sonos";
	incoming.SetMetadata("ssdp.server", "Linux UPnP/1.0 Sonos/57.3");

	EXPECT_TRUE(MergeDevice(existing, incoming, policy));
	EXPECT_EQ(existing.friendly_name, "Kitchen");
	EXPECT_EQ(existing.method, DiscoveryMethod::SSDP);
	EXPECT_EQ(existing.manufacturer, "Sonos");

	/* metadata of both sources is kept */
	ASSERT_NE(existing.GetMetadata("port_scan.port"), nullptr);
	EXPECT_EQ(*existing.GetMetadata("port_scan.port"), "1400");
	ASSERT_NE(existing.GetMetadata("ssdp.server"), nullptr);
}

TEST(DeviceMerge, PortScanDoesNotOverwrite)
{
	const MergePolicy policy;

	Device existing = MakeDevice(DiscoveryMethod::SSDP, "Kitchen");
	Device incoming = MakeDevice(DiscoveryMethod::PORT_SCAN,
				     "Sonos Speaker at 192.168.1.20");
	incoming.SetMetadata("port_scan.port", "1400");

	EXPECT_TRUE(MergeDevice(existing, incoming, policy));
	EXPECT_EQ(existing.friendly_name, "Kitchen");
	EXPECT_EQ(existing.method, DiscoveryMethod::SSDP);
	EXPECT_NE(existing.GetMetadata("port_scan.port"), nullptr);

	/* the same record again changes nothing */
	EXPECT_FALSE(MergeDevice(existing, incoming, policy));
}

TEST(DeviceMerge, NonGenericNameWins)
{
	const MergePolicy policy;

	Device existing = MakeDevice(DiscoveryMethod::SSDP,
				     "Sonos Speaker at 192.168.1.20");
	Device incoming = MakeDevice(DiscoveryMethod::SSDP, "Kitchen");

	EXPECT_TRUE(MergeDevice(existing, incoming, policy));
	EXPECT_EQ(existing.friendly_name, "Kitchen");

	Device generic = MakeDevice(DiscoveryMethod::SSDP,
				    "UPnP Device at 192.168.1.20");
	MergeDevice(existing, generic, policy);
	EXPECT_EQ(existing.friendly_name, "Kitchen");
}

TEST(DeviceMerge, KnownClassBreaksTie)
{
	const MergePolicy policy;

	Device existing = MakeDevice(DiscoveryMethod::SSDP, "Kitchen");
	existing.classification = HeuristicClass{"Sonos", "SSDP headers"};

	Device incoming = MakeDevice(DiscoveryMethod::SSDP, "Kitchen");
	incoming.model_name = "Play:1";
	incoming.classification = KnownClass{"Sonos"};

	EXPECT_TRUE(MergeDevice(existing, incoming, policy));
	EXPECT_EQ(existing.model_name, "Play:1");
	EXPECT_TRUE(std::holds_alternative<KnownClass>(existing.classification));
}

TEST(DeviceMerge, MetadataIncomingWins)
{
	const MergePolicy policy;

	Device existing = MakeDevice(DiscoveryMethod::SSDP, "Kitchen");
	existing.SetMetadata("xml.modelName", "old");

	Device incoming = MakeDevice(DiscoveryMethod::MDNS, "Kitchen");
	incoming.SetMetadata("xml.modelName", "new");

	EXPECT_TRUE(MergeDevice(existing, incoming, policy));
	EXPECT_EQ(existing.method, DiscoveryMethod::SSDP);
	EXPECT_EQ(*existing.GetMetadata("xml.modelName"), "new");
}

TEST(DeviceKey, Parse)
{
	const auto key = ParseDeviceKey("192.168.1.20:1400");
	EXPECT_EQ(key.ip, "192.168.1.20");
	EXPECT_EQ(key.port, 1400u);
	EXPECT_EQ(ToString(key), "192.168.1.20:1400");

	EXPECT_THROW(ParseDeviceKey("192.168.1.20"), std::runtime_error);
	EXPECT_THROW(ParseDeviceKey("192.168.1.20:0"), std::runtime_error);
	EXPECT_THROW(ParseDeviceKey("192.168.1.20:99999"), std::runtime_error);
}
