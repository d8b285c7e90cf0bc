// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "blast/Metrics.hxx"
#include "control/Result.hxx"
#include "discovery/Stats.hxx"

#include <gtest/gtest.h>

using std::chrono::milliseconds;

static Device
MakeDevice(const char *ip, DiscoveryMethod method, const char *manufacturer)
{
	Device device(ip, 1400, method);
	device.friendly_name = ip;
	device.manufacturer = manufacturer;
	return device;
}

TEST(Metrics, Empty)
{
	const MetricsSnapshot m;
	EXPECT_EQ(m.GetSettled(), 0u);
	EXPECT_EQ(m.GetInFlight(), 0u);
	EXPECT_EQ(m.GetSuccessRate(), 0.);
	EXPECT_EQ(m.GetAverageSoapTime(), milliseconds{});
	EXPECT_EQ(m.GetFastest(), nullptr);
	EXPECT_EQ(m.GetSlowest(), nullptr);
	EXPECT_FALSE(m.complete);
}

TEST(Metrics, Accumulate)
{
	MetricsAccumulator a;

	const Device sonos1 = MakeDevice("10.0.0.1", DiscoveryMethod::SSDP, "Sonos");
	const Device sonos2 = MakeDevice("10.0.0.2", DiscoveryMethod::PORT_SCAN, "Sonos");
	const Device unknown = MakeDevice("10.0.0.3", DiscoveryMethod::PORT_SCAN, "");

	a.AddAttempt();
	a.AddAttempt();
	a.AddAttempt();

	a.AddResult(sonos1, ControlResult::Success(sonos1.GetKey(), milliseconds{300}));
	EXPECT_EQ(a.Get().GetInFlight(), 2u);

	a.AddResult(sonos2, ControlResult::Success(sonos2.GetKey(), milliseconds{500}));
	a.AddResult(unknown, ControlResult::Failure(unknown.GetKey(),
						    milliseconds{5000},
						    "Timeout was reached"));

	const auto &m = a.Get();
	EXPECT_EQ(m.attempts, 3u);
	EXPECT_EQ(m.successes, 2u);
	EXPECT_EQ(m.failures, 1u);
	EXPECT_EQ(m.GetInFlight(), 0u);
	EXPECT_DOUBLE_EQ(m.GetSuccessRate(), 2. / 3.);

	/* only successful devices count */
	EXPECT_EQ(m.GetAverageSoapTime(), milliseconds{400});
	ASSERT_NE(m.GetFastest(), nullptr);
	EXPECT_EQ(m.GetFastest()->key.ip, "10.0.0.1");
	ASSERT_NE(m.GetSlowest(), nullptr);
	EXPECT_EQ(m.GetSlowest()->key.ip, "10.0.0.2");

	ASSERT_EQ(m.manufacturers.size(), 2u);
	EXPECT_EQ(m.manufacturers.at("Sonos").attempts, 2u);
	EXPECT_DOUBLE_EQ(m.manufacturers.at("Sonos").GetSuccessRatio(), 1.);
	EXPECT_DOUBLE_EQ(m.manufacturers.at("Unknown").GetSuccessRatio(), 0.);

	const auto &port_scan = m.methods[std::size_t(DiscoveryMethod::PORT_SCAN)];
	EXPECT_EQ(port_scan.attempts, 2u);
	EXPECT_EQ(port_scan.successes, 1u);

	ASSERT_EQ(m.device_results.size(), 3u);
	EXPECT_EQ(m.device_results.back().error, "Timeout was reached");
}

TEST(Metrics, PublishIsImmutable)
{
	MetricsAccumulator a;
	a.AddAttempt();

	const auto snapshot = a.Publish();
	a.AddAttempt();
	a.Complete(milliseconds{1234});

	EXPECT_EQ(snapshot->attempts, 1u);
	EXPECT_FALSE(snapshot->complete);

	const auto final_snapshot = a.Publish();
	EXPECT_EQ(final_snapshot->attempts, 2u);
	EXPECT_TRUE(final_snapshot->complete);
	EXPECT_EQ(final_snapshot->total_blast_duration, milliseconds{1234});

	a.Reset();
	EXPECT_EQ(a.Get().attempts, 0u);
	EXPECT_FALSE(a.Get().complete);
}

TEST(DiscoveryStats, MostEffective)
{
	DiscoveryStats stats;
	EXPECT_EQ(stats.GetMostEffectiveMethod(), DiscoveryMethod::SSDP);

	stats[DiscoveryMethod::SSDP].devices_found = 2;
	stats[DiscoveryMethod::SSDP].duration = milliseconds{4000};
	stats[DiscoveryMethod::PORT_SCAN].devices_found = 6;
	stats[DiscoveryMethod::PORT_SCAN].duration = milliseconds{3000};

	EXPECT_DOUBLE_EQ(stats[DiscoveryMethod::PORT_SCAN].GetEfficiency(), 2.);
	EXPECT_EQ(stats.GetMostEffectiveMethod(), DiscoveryMethod::PORT_SCAN);
	EXPECT_EQ(stats.GetTotalDevices(), 8u);
}
