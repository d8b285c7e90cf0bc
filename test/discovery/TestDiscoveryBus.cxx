// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FakeDiscoverer.hxx"
#include "BreakTimer.hxx"
#include "discovery/Bus.hxx"
#include "device/Merge.hxx"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

class RecordingListener final : public DiscoveryBusListener {
	EventLoop &event_loop;

public:
	unsigned n_new = 0, n_updates = 0, n_finished = 0;

	std::vector<Device> found;

	explicit RecordingListener(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	void OnBusDevice(const Device &device, bool is_new) noexcept override {
		if (is_new) {
			++n_new;
			found.push_back(device);
		} else
			++n_updates;
	}

	void OnBusDescriptionProgress(unsigned, unsigned) noexcept override {
	}

	void OnBusFinished() noexcept override {
		++n_finished;
		event_loop.Break();
	}
};

struct DiscoveryBusTest : ::testing::Test {
	EventLoop event_loop;
	FakeDiscovererFactory factory{event_loop};
	RecordingListener listener{event_loop};
	DiscoveryBus bus{event_loop, MergePolicy{}, listener};

	void Run(Event::Duration limit=2s) noexcept {
		BreakTimer timer(event_loop, limit);
		event_loop.Run();
		EXPECT_FALSE(timer.expired);
	}
};

} // anonymous namespace

TEST_F(DiscoveryBusTest, MergeAcrossMethods)
{
	factory.scripts = {
		{DiscoveryMethod::PORT_SCAN, {
				{1ms, MakeFakeDevice("10.0.0.5", 1400, DiscoveryMethod::PORT_SCAN,
						     "Sonos Speaker at 10.0.0.5", "Sonos")},
				{1ms, MakeFakeDevice("10.0.0.6", 8080, DiscoveryMethod::PORT_SCAN,
						     "Device at 10.0.0.6:8080")},
			}},
		{DiscoveryMethod::SSDP, {
				{20ms, MakeFakeDevice("10.0.0.5", 1400, DiscoveryMethod::SSDP,
						      "Kitchen", "Sonos")},
			}},
	};

	bus.Start(factory, 1s);
	EXPECT_TRUE(bus.IsRunning());

	Run();

	/* all discoverers have finished: no need to wait for the
	   deadline */
	EXPECT_TRUE(bus.IsFinished());
	EXPECT_LT(bus.GetDuration(), 1000ms);
	EXPECT_EQ(listener.n_finished, 1u);

	ASSERT_EQ(bus.GetDevices().size(), 2u);
	EXPECT_EQ(listener.n_new, 2u);
	EXPECT_EQ(listener.n_updates, 1u);

	const Device *kitchen = bus.Find({"10.0.0.5", 1400});
	ASSERT_NE(kitchen, nullptr);
	EXPECT_EQ(kitchen->friendly_name, "Kitchen");
	EXPECT_EQ(kitchen->method, DiscoveryMethod::SSDP);

	const auto &stats = bus.GetStats();
	EXPECT_EQ(stats[DiscoveryMethod::PORT_SCAN].devices_found, 2u);
	EXPECT_EQ(stats[DiscoveryMethod::SSDP].devices_found, 0u);
	EXPECT_TRUE(stats[DiscoveryMethod::SSDP].enabled);
	EXPECT_FALSE(stats[DiscoveryMethod::MDNS].enabled);
}

TEST_F(DiscoveryBusTest, Deadline)
{
	FakeScript ssdp{DiscoveryMethod::SSDP, {
			{5ms, MakeFakeDevice("10.0.0.7", 80, DiscoveryMethod::SSDP,
					     "UPnP Device at 10.0.0.7")},
			/* after the deadline: dropped */
			{200ms, MakeFakeDevice("10.0.0.8", 80, DiscoveryMethod::SSDP,
					       "UPnP Device at 10.0.0.8")},
		}};
	ssdp.finish = false;
	factory.scripts = {ssdp};

	bus.Start(factory, 50ms);
	Run();

	EXPECT_TRUE(bus.IsFinished());
	EXPECT_GE(bus.GetDuration(), 50ms);
	ASSERT_EQ(bus.GetDevices().size(), 1u);

	RunFor(event_loop, 300ms);
	EXPECT_EQ(bus.GetDevices().size(), 1u);
	EXPECT_EQ(listener.n_finished, 1u);
}

TEST_F(DiscoveryBusTest, LateUpdate)
{
	FakeScript ssdp{DiscoveryMethod::SSDP, {
			{1ms, MakeFakeDevice("10.0.0.7", 80, DiscoveryMethod::SSDP,
					     "UPnP Device at 10.0.0.7")},
			/* a description download completing after the
			   deadline */
			{100ms, MakeFakeDevice("10.0.0.7", 80, DiscoveryMethod::SSDP,
					       "Living Room TV", "Samsung"), true},
			/* the same description again: nothing changes */
			{100ms, MakeFakeDevice("10.0.0.7", 80, DiscoveryMethod::SSDP,
					       "Living Room TV", "Samsung"), true},
		}};
	ssdp.finish = false;
	factory.scripts = {ssdp};

	bus.Start(factory, 20ms);
	Run();
	ASSERT_EQ(bus.GetDevices().size(), 1u);
	EXPECT_EQ(bus.GetDevices().front().friendly_name,
		  "UPnP Device at 10.0.0.7");

	RunFor(event_loop, 130ms);

	EXPECT_EQ(listener.n_updates, 1u);
	ASSERT_EQ(bus.GetDevices().size(), 1u);
	const Device updated = bus.GetDevices().front();
	EXPECT_EQ(updated.friendly_name, "Living Room TV");
	EXPECT_EQ(updated.manufacturer, "Samsung");

	RunFor(event_loop, 150ms);

	EXPECT_EQ(listener.n_new, 1u);
	EXPECT_EQ(listener.n_updates, 1u);
	ASSERT_EQ(bus.GetDevices().size(), 1u);
	EXPECT_EQ(bus.GetDevices().front(), updated);
}

TEST_F(DiscoveryBusTest, StartFailure)
{
	FakeScript mdns{DiscoveryMethod::MDNS, {}};
	mdns.fail = true;

	factory.scripts = {
		mdns,
		{DiscoveryMethod::PORT_SCAN, {
				{1ms, MakeFakeDevice("10.0.0.9", 8009, DiscoveryMethod::PORT_SCAN,
						     "Chromecast at 10.0.0.9", "Google")},
			}},
	};

	bus.Start(factory, 1s);
	Run();

	const auto &stats = bus.GetStats();
	EXPECT_TRUE(stats[DiscoveryMethod::MDNS].enabled);
	EXPECT_TRUE(stats[DiscoveryMethod::MDNS].failed);
	EXPECT_FALSE(stats[DiscoveryMethod::PORT_SCAN].failed);
	EXPECT_EQ(bus.GetDevices().size(), 1u);
}

TEST_F(DiscoveryBusTest, AllFailed)
{
	FakeScript ssdp{DiscoveryMethod::SSDP, {}};
	ssdp.fail = true;
	factory.scripts = {ssdp};

	bus.Start(factory, 1s);
	Run();

	EXPECT_TRUE(bus.IsFinished());
	EXPECT_TRUE(bus.GetDevices().empty());
	EXPECT_EQ(listener.n_finished, 1u);
}

TEST_F(DiscoveryBusTest, Cancel)
{
	FakeScript ssdp{DiscoveryMethod::SSDP, {
			{50ms, MakeFakeDevice("10.0.0.7", 80, DiscoveryMethod::SSDP,
					      "UPnP Device at 10.0.0.7")},
		}};
	factory.scripts = {ssdp};

	bus.Start(factory, 1s);
	RunFor(event_loop, 10ms);
	bus.Cancel();
	RunFor(event_loop, 100ms);

	EXPECT_FALSE(bus.IsRunning());
	EXPECT_FALSE(bus.IsFinished());
	EXPECT_TRUE(bus.GetDevices().empty());
	EXPECT_EQ(listener.n_finished, 0u);
}

TEST_F(DiscoveryBusTest, Restart)
{
	factory.scripts = {
		{DiscoveryMethod::SSDP, {
				{1ms, MakeFakeDevice("10.0.0.7", 80, DiscoveryMethod::SSDP,
						     "UPnP Device at 10.0.0.7")},
			}},
	};

	bus.Start(factory, 1s);
	Run();
	EXPECT_EQ(bus.GetDevices().size(), 1u);

	/* a new run starts with an empty device list */
	factory.scripts.clear();
	bus.Start(factory, 1s);
	Run();

	EXPECT_TRUE(bus.GetDevices().empty());
	EXPECT_EQ(listener.n_finished, 2u);
	EXPECT_EQ(factory.n_created, 2u);
}
