// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "discovery/FakeDiscoverer.hxx"
#include "BreakTimer.hxx"
#include "blast/Service.hxx"
#include "blast/Config.hxx"
#include "blast/Observer.hxx"
#include "blast/Metrics.hxx"
#include "blast/MediaServer.hxx"
#include "control/Control.hxx"
#include "control/Result.hxx"
#include "event/Call.hxx"
#include "event/DeferEvent.hxx"
#include "event/Thread.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct FakeBehaviour {
	Event::Duration delay = 20ms;
	bool succeed = true;

	/**
	 * Throw in PushClip().
	 */
	bool local_error = false;
};

class FakeDeviceControl final : public DeviceControl {
	class Operation final : public ControlOperation {
		FakeDeviceControl &parent;
		ControlHandler &handler;
		const DeviceKey key;
		const FakeBehaviour behaviour;
		FineTimerEvent timer;
		bool done = false;

	public:
		Operation(FakeDeviceControl &_parent, ControlHandler &_handler,
			  DeviceKey &&_key, const FakeBehaviour &_behaviour) noexcept
			:parent(_parent), handler(_handler),
			 key(std::move(_key)), behaviour(_behaviour),
			 timer(parent.event_loop, BIND_THIS_METHOD(OnTimer))
		{
			++parent.in_flight;
			parent.max_in_flight = std::max(parent.max_in_flight,
							parent.in_flight);
			timer.Schedule(behaviour.delay);
		}

		~Operation() noexcept override {
			if (!done)
				--parent.in_flight;
		}

	private:
		void OnTimer() noexcept {
			done = true;
			--parent.in_flight;

			const auto duration =
				std::chrono::duration_cast<std::chrono::milliseconds>(behaviour.delay);
			auto result = behaviour.succeed
				? ControlResult::Success(key, duration)
				: ControlResult::Failure(key, duration,
							 "Fake failure");

			/* this may destroy the operation */
			handler.OnControlResult(std::move(result));
		}
	};

	EventLoop &event_loop;

public:
	std::map<std::string, FakeBehaviour, std::less<>> behaviours;

	unsigned in_flight = 0, max_in_flight = 0;

	std::vector<std::string> controlled;
	std::string media_url;

	explicit FakeDeviceControl(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	std::unique_ptr<ControlOperation>
	PushClip(const Device &device, std::string_view _media_url,
		 ControlHandler &handler) override {
		controlled.push_back(device.friendly_name);
		media_url = _media_url;

		FakeBehaviour behaviour;
		if (auto i = behaviours.find(device.ip_address);
		    i != behaviours.end())
			behaviour = i->second;

		if (behaviour.local_error)
			throw std::runtime_error("Fake local error");

		return std::make_unique<Operation>(*this, handler,
						   device.GetKey(),
						   behaviour);
	}
};

class FailingMediaServer final : public MediaServer {
	DeferEvent defer;
	MediaServerHandler *handler = nullptr;

public:
	explicit FailingMediaServer(EventLoop &event_loop) noexcept
		:defer(event_loop, BIND_THIS_METHOD(OnDeferred)) {}

	void Start(MediaServerHandler &_handler) noexcept override {
		handler = &_handler;
		defer.Schedule();
	}

	void Stop() noexcept override {
		defer.Cancel();
	}

private:
	void OnDeferred() noexcept {
		handler->OnMediaServerError(std::make_exception_ptr(std::runtime_error("Address already in use")));
	}
};

class RecordingObserver final : public BlastObserver {
	EventLoop &event_loop;

public:
	bool break_on_idle = true;

	std::vector<BlastState> states;
	std::map<std::string, DeviceStatus, std::less<>> status;
	std::vector<std::string> errors;
	unsigned n_summaries = 0, n_metrics = 0;
	std::shared_ptr<const MetricsSnapshot> last_metrics;
	std::optional<MetricsSnapshot> summary;

	explicit RecordingObserver(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	void OnBlastState(BlastState state) noexcept override {
		states.push_back(state);
		if (state == BlastState::IDLE && break_on_idle)
			event_loop.Break();
	}

	void OnBlastMetrics(std::shared_ptr<const MetricsSnapshot> metrics) noexcept override {
		++n_metrics;
		last_metrics = std::move(metrics);
	}

	void OnDeviceStatus(const Device &device,
			    DeviceStatus s) noexcept override {
		status.insert_or_assign(device.ip_address, s);
	}

	void OnBlastError(std::exception_ptr error) noexcept override {
		errors.push_back(GetFullMessage(error));
	}

	void OnBlastSummary(const MetricsSnapshot &metrics) noexcept override {
		++n_summaries;
		summary = metrics;
	}
};

/**
 * Calls BlastService::Stop() from inside the #EventLoop.
 */
class StopTimer final {
	BlastService &service;
	FineTimerEvent timer;

public:
	StopTimer(EventLoop &event_loop, BlastService &_service,
		  Event::Duration d) noexcept
		:service(_service),
		 timer(event_loop, BIND_THIS_METHOD(OnTimer))
	{
		timer.Schedule(d);
	}

private:
	void OnTimer() noexcept {
		service.Stop();
	}
};

static BlastConfig
MakeConfig(unsigned concurrency)
{
	BlastConfig config;
	config.media_url = "http://127.0.0.1:8080/media/current.mp3";
	config.concurrency = concurrency;
	config.discovery.timeout = 500ms;
	return config;
}

static FakeScript
MakeSsdpScript(unsigned n_devices)
{
	FakeScript script{DiscoveryMethod::SSDP, {}};

	for (unsigned i = 0; i < n_devices; ++i) {
		const std::string ip = "10.0.0." + std::to_string(10 + i);
		script.steps.push_back({1ms, MakeFakeDevice(ip.c_str(), 1400,
							    DiscoveryMethod::SSDP,
							    ("Speaker " + std::to_string(i)).c_str(),
							    "Sonos")});
	}

	return script;
}

struct BlastServiceTest : ::testing::Test {
	EventLoop event_loop;
	FakeDiscovererFactory factory{event_loop};
	FakeDeviceControl control{event_loop};
	RecordingObserver observer{event_loop};

	void Run(Event::Duration limit=5s) noexcept {
		BreakTimer timer(event_loop, limit);
		event_loop.Run();
		EXPECT_FALSE(timer.expired);
	}
};

} // anonymous namespace

TEST_F(BlastServiceTest, ConcurrencyWaves)
{
	factory.scripts = {MakeSsdpScript(5)};
	control.behaviours["10.0.0.12"].succeed = false;

	const auto config = MakeConfig(2);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();
	EXPECT_EQ(service.GetState(), BlastState::SERVING);

	Run();

	EXPECT_EQ(service.GetState(), BlastState::IDLE);
	EXPECT_EQ(observer.states,
		  (std::vector<BlastState>{
			  BlastState::SERVING,
			  BlastState::DISCOVERING,
			  BlastState::CONTROLLING,
			  BlastState::SUMMARIZING,
			  BlastState::DONE,
			  BlastState::IDLE,
		  }));

	EXPECT_EQ(control.controlled.size(), 5u);
	EXPECT_EQ(control.media_url, config.media_url);
	EXPECT_EQ(control.max_in_flight, 2u);
	EXPECT_EQ(service.GetPeakConcurrency(), 2u);

	ASSERT_EQ(observer.n_summaries, 1u);
	const auto &summary = *observer.summary;
	EXPECT_TRUE(summary.complete);
	EXPECT_EQ(summary.devices_discovered, 5u);
	EXPECT_EQ(summary.attempts, 5u);
	EXPECT_EQ(summary.successes, 4u);
	EXPECT_EQ(summary.failures, 1u);
	EXPECT_DOUBLE_EQ(summary.GetSuccessRate(), 0.8);
	EXPECT_EQ(summary.manufacturers.at("Sonos").attempts, 5u);

	/* three waves of 20 ms */
	EXPECT_GE(summary.total_blast_duration, 60ms);

	EXPECT_EQ(observer.status.at("10.0.0.10"), DeviceStatus::SUCCESS);
	EXPECT_EQ(observer.status.at("10.0.0.12"), DeviceStatus::FAILED);

	const auto metrics = service.GetMetrics();
	ASSERT_TRUE(metrics);
	EXPECT_TRUE(metrics->complete);
	EXPECT_EQ(metrics->attempts, 5u);
}

TEST_F(BlastServiceTest, StopDuringDiscovery)
{
	FakeScript script = MakeSsdpScript(2);
	script.finish = false;
	/* a late update which must be discarded */
	script.steps.push_back({100ms, MakeFakeDevice("10.0.0.10", 1400,
						      DiscoveryMethod::SSDP,
						      "Kitchen"), true});
	factory.scripts = {script};

	const auto config = MakeConfig(3);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();

	{
		StopTimer stop(event_loop, service, 30ms);
		Run();
	}

	EXPECT_EQ(service.GetState(), BlastState::IDLE);
	EXPECT_EQ(observer.states.back(), BlastState::IDLE);

	RunFor(event_loop, 200ms);

	EXPECT_TRUE(control.controlled.empty());
	EXPECT_EQ(observer.n_summaries, 0u);
	EXPECT_EQ(service.GetMetrics()->attempts, 0u);
	EXPECT_EQ(service.GetMetrics()->device_results.size(), 0u);
	EXPECT_EQ(observer.status.at("10.0.0.10"), DeviceStatus::DISCOVERED);
}

TEST_F(BlastServiceTest, StopDuringControl)
{
	factory.scripts = {MakeSsdpScript(3)};
	control.behaviours["10.0.0.10"].delay = 1s;

	const auto config = MakeConfig(3);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();

	{
		StopTimer stop(event_loop, service, 100ms);
		Run();
	}

	EXPECT_EQ(service.GetState(), BlastState::IDLE);
	EXPECT_EQ(control.controlled.size(), 3u);

	/* the pending operation was canceled */
	EXPECT_EQ(control.in_flight, 0u);
	EXPECT_EQ(observer.n_summaries, 0u);
}

TEST_F(BlastServiceTest, MissingMediaUrl)
{
	factory.scripts = {MakeSsdpScript(2)};

	auto config = MakeConfig(3);
	config.media_url.clear();
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();
	Run();

	EXPECT_EQ(service.GetState(), BlastState::IDLE);
	ASSERT_EQ(observer.errors.size(), 1u);
	EXPECT_EQ(observer.errors.front(), "No media URL");
	EXPECT_TRUE(control.controlled.empty());
	EXPECT_EQ(service.GetMetrics()->attempts, 0u);
	EXPECT_EQ(observer.n_summaries, 0u);
}

TEST_F(BlastServiceTest, MediaServerError)
{
	const auto config = MakeConfig(3);
	FailingMediaServer media_server(event_loop);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();
	Run();

	EXPECT_EQ(observer.states,
		  (std::vector<BlastState>{
			  BlastState::SERVING,
			  BlastState::IDLE,
		  }));
	ASSERT_EQ(observer.errors.size(), 1u);
	EXPECT_EQ(factory.n_created, 0u);
}

TEST_F(BlastServiceTest, LocalControlError)
{
	factory.scripts = {MakeSsdpScript(2)};
	control.behaviours["10.0.0.11"].local_error = true;

	const auto config = MakeConfig(3);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();
	Run();

	ASSERT_EQ(observer.n_summaries, 1u);
	EXPECT_EQ(observer.summary->attempts, 2u);
	EXPECT_EQ(observer.summary->successes, 1u);
	EXPECT_EQ(observer.summary->failures, 1u);

	const auto &results = observer.summary->device_results;
	const auto failed = std::find_if(results.begin(), results.end(),
					 [](const DeviceControlRecord &r){
						 return !r.succeeded;
					 });
	ASSERT_NE(failed, results.end());
	EXPECT_EQ(failed->key.ip, "10.0.0.11");
	EXPECT_EQ(failed->error, "Fake local error");
}

TEST_F(BlastServiceTest, NoDevices)
{
	const auto config = MakeConfig(3);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();
	Run();

	ASSERT_EQ(observer.n_summaries, 1u);
	EXPECT_EQ(observer.summary->attempts, 0u);
	EXPECT_DOUBLE_EQ(observer.summary->GetSuccessRate(), 0.);
	EXPECT_EQ(observer.states.back(), BlastState::IDLE);
}

TEST_F(BlastServiceTest, DiscoverOnlyThenBlast)
{
	factory.scripts = {MakeSsdpScript(3)};

	const auto config = MakeConfig(3);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartDiscoverOnly();
	Run();

	EXPECT_EQ(observer.states,
		  (std::vector<BlastState>{
			  BlastState::DISCOVERING,
			  BlastState::IDLE,
		  }));
	EXPECT_EQ(service.GetDevices().size(), 3u);
	EXPECT_TRUE(control.controlled.empty());

	/* the blast reuses the discovered devices */
	service.StartBlast();
	Run();

	EXPECT_EQ(factory.n_created, 1u);
	EXPECT_EQ(control.controlled.size(), 3u);
	ASSERT_EQ(observer.n_summaries, 1u);
	EXPECT_EQ(observer.summary->devices_discovered, 3u);
	EXPECT_EQ(observer.summary->successes, 3u);
}

TEST_F(BlastServiceTest, StartSingle)
{
	factory.scripts = {MakeSsdpScript(2)};

	const auto config = MakeConfig(3);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartDiscoverOnly();
	Run();

	/* the discovered record is used instead of the bare one */
	service.StartSingle(MakeFakeDevice("10.0.0.11", 1400,
					   DiscoveryMethod::PORT_SCAN,
					   "Sonos Speaker at 10.0.0.11"));
	Run();

	ASSERT_EQ(control.controlled.size(), 1u);
	EXPECT_EQ(control.controlled.front(), "Speaker 1");
	EXPECT_EQ(observer.summary->attempts, 1u);
	EXPECT_EQ(factory.n_created, 1u);

	/* an unknown device is controlled as given */
	service.StartSingle(MakeFakeDevice("10.0.0.99", 8080,
					   DiscoveryMethod::PORT_SCAN,
					   "Device at 10.0.0.99:8080"));
	Run();

	ASSERT_EQ(control.controlled.size(), 2u);
	EXPECT_EQ(control.controlled.back(), "Device at 10.0.0.99:8080");
}

TEST_F(BlastServiceTest, Busy)
{
	factory.scripts = {MakeSsdpScript(1)};

	const auto config = MakeConfig(3);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	service.StartBlast();
	EXPECT_THROW(service.StartBlast(), std::runtime_error);
	EXPECT_THROW(service.StartDiscoverOnly(), std::runtime_error);

	Run();
	EXPECT_EQ(control.controlled.size(), 1u);
}

TEST(BlastServiceThread, MetricsFromOtherThread)
{
	EventThread thread;
	auto &event_loop = thread.GetEventLoop();

	FakeDiscovererFactory factory{event_loop};
	factory.scripts = {MakeSsdpScript(4)};
	FakeDeviceControl control{event_loop};
	RecordingObserver observer{event_loop};
	observer.break_on_idle = false;

	const auto config = MakeConfig(2);
	ExternalMediaServer media_server(event_loop, config.media_url);
	BlastService service(event_loop, config, factory, control,
			     media_server, observer);

	thread.Start();

	BlockingCall(event_loop, [&service](){
		service.StartBlast();
	});

	/* poll the published snapshot without entering the
	   EventLoop thread */
	std::shared_ptr<const MetricsSnapshot> metrics;
	for (unsigned i = 0; i < 500; ++i) {
		metrics = service.GetMetrics();
		if (metrics->complete)
			break;

		std::this_thread::sleep_for(10ms);
	}

	ASSERT_TRUE(metrics->complete);
	EXPECT_EQ(metrics->attempts, 4u);
	EXPECT_EQ(metrics->successes, 4u);

	BlastState state;
	BlockingCall(event_loop, [&service, &state](){
		state = service.GetState();
	});
	EXPECT_TRUE(state == BlastState::DONE || state == BlastState::IDLE);

	thread.Stop();
}
