// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Service.hxx"
#include "Config.hxx"
#include "Observer.hxx"
#include "control/Control.hxx"
#include "control/Result.hxx"
#include "discovery/Factory.hxx"
#include "device/Merge.hxx"
#include "event/Loop.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

static constexpr Domain blast_domain("blast");

/**
 * One control attempt in progress.
 */
class BlastService::ControlTask final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>>,
	  ControlHandler
{
	BlastService &parent;

	std::unique_ptr<ControlOperation> operation;

public:
	Device device;

	ControlTask(BlastService &_parent, Device &&_device) noexcept
		:parent(_parent), device(std::move(_device)) {}

	/**
	 * Throws on error.
	 */
	void Start(DeviceControl &control, std::string_view media_url) {
		operation = control.PushClip(device, media_url, *this);
	}

private:
	/* virtual methods from class ControlHandler */
	void OnControlResult(ControlResult &&result) noexcept override {
		parent.OnTaskDone(*this, std::move(result));
	}
};

BlastService::BlastService(EventLoop &_event_loop, const BlastConfig &config,
			   DiscovererFactory &_discoverer_factory,
			   DeviceControl &_control,
			   MediaServer &_media_server,
			   BlastObserver &_observer)
	:event_loop(_event_loop),
	 concurrency(std::max(config.concurrency, 1U)),
	 discovery_timeout(config.discovery.timeout),
	 discoverer_factory(_discoverer_factory),
	 control(_control),
	 media_server(_media_server),
	 observer(_observer),
	 bus(event_loop, config.discovery.merge, *this),
	 defer_settled(event_loop, BIND_THIS_METHOD(OnSettled)),
	 defer_reset(event_loop, BIND_THIS_METHOD(OnDeferredReset)),
	 snapshot(metrics.Publish())
{
}

BlastService::~BlastService() noexcept
{
	tasks.clear_and_dispose([](ControlTask *task){ delete task; });
}

void
BlastService::CheckIdle() const
{
	if (state != BlastState::IDLE)
		throw std::runtime_error(fmt::format("Cannot start: blast is {}",
						     ToString(state)));
}

void
BlastService::StartBlast()
{
	CheckIdle();

	mode = Mode::BLAST;
	StartServing();
}

void
BlastService::StartDiscoverOnly()
{
	CheckIdle();

	mode = Mode::DISCOVER_ONLY;
	metrics.Reset();
	Publish();
	StartDiscovery();
}

void
BlastService::StartSingle(const Device &device)
{
	CheckIdle();

	mode = Mode::SINGLE;

	/* prefer the discovered record which may carry more
	   details */
	const auto key = device.GetKey();
	auto i = std::find_if(devices.begin(), devices.end(),
			      [&key](const Device &d){
				      return d.GetKey() == key;
			      });
	if (i == devices.end()) {
		devices.clear();
		devices.push_back(device);
	} else {
		Device d = std::move(*i);
		devices.clear();
		devices.push_back(std::move(d));
	}

	StartServing();
}

void
BlastService::SetState(BlastState new_state) noexcept
{
	if (new_state == state)
		return;

	FmtDebug(blast_domain, "state {} -> {}",
		 ToString(state), ToString(new_state));

	state = new_state;
	observer.OnBlastState(state);
}

void
BlastService::Publish() noexcept
{
	auto s = metrics.Publish();

	{
		const std::scoped_lock lock{snapshot_mutex};
		snapshot = s;
	}

	observer.OnBlastMetrics(std::move(s));
}

std::chrono::milliseconds
BlastService::GetPhaseElapsed() noexcept
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(event_loop.SteadyNow() - phase_start);
}

void
BlastService::StartServing() noexcept
{
	metrics.Reset();
	peak_concurrency = 0;
	Publish();

	SetState(BlastState::SERVING);
	phase_start = event_loop.SteadyNow();
	media_server.Start(*this);
}

void
BlastService::OnMediaServerReady(std::string url) noexcept
{
	if (state != BlastState::SERVING)
		return;

	media_url = std::move(url);
	metrics.SetServeStartup(GetPhaseElapsed());
	FmtInfo(blast_domain, "serving {:?}", media_url);

	if (mode == Mode::SINGLE) {
		metrics.SetDevicesDiscovered(devices.size());
		Publish();
		StartControl();
	} else
		StartDiscovery();
}

void
BlastService::OnMediaServerError(std::exception_ptr error) noexcept
{
	if (state != BlastState::SERVING)
		return;

	Fail(std::move(error));
}

void
BlastService::StartDiscovery() noexcept
{
	SetState(BlastState::DISCOVERING);

	if (mode == Mode::BLAST && reuse_devices) {
		reuse_devices = false;

		FmtInfo(blast_domain, "reusing {} discovered devices",
			devices.size());

		metrics.SetDiscovery({}, devices.size(), bus.GetStats());
		Publish();
		StartControl();
		return;
	}

	devices.clear();
	reuse_devices = false;
	phase_start = event_loop.SteadyNow();

	try {
		bus.Start(discoverer_factory, discovery_timeout);
	} catch (...) {
		Fail(std::current_exception());
	}
}

void
BlastService::OnBusDevice(const Device &device, bool is_new) noexcept
{
	switch (state) {
	case BlastState::DISCOVERING:
		metrics.SetDevicesDiscovered(bus.GetDevices().size());
		observer.OnDeviceStatus(device, DeviceStatus::DISCOVERED);
		Publish();
		break;

	case BlastState::CONTROLLING:
		/* a late update (e.g. from a description download)
		   refreshes devices still waiting for a slot */
		if (!is_new) {
			const auto key = device.GetKey();
			for (auto &i : queue) {
				if (i.GetKey() == key) {
					i = device;
					observer.OnDeviceStatus(i, DeviceStatus::DISCOVERED);
					break;
				}
			}
		}

		break;

	case BlastState::IDLE:
		/* keep the result of a discover-only run current */
		if (reuse_devices) {
			const auto key = device.GetKey();
			auto i = std::find_if(devices.begin(), devices.end(),
					      [&key](const Device &d){
						      return d.GetKey() == key;
					      });
			if (i != devices.end())
				*i = device;
			else
				devices.push_back(device);
		}

		break;

	case BlastState::SERVING:
	case BlastState::SUMMARIZING:
	case BlastState::DONE:
		break;
	}
}

void
BlastService::OnBusDescriptionProgress(unsigned in_flight,
				       unsigned completed) noexcept
{
	FmtDebug(blast_domain, "descriptions: {} in flight, {} completed",
		 in_flight, completed);
}

void
BlastService::OnBusFinished() noexcept
{
	if (state != BlastState::DISCOVERING)
		return;

	devices = bus.GetDevices();
	metrics.SetDiscovery(bus.GetDuration(), devices.size(),
			     bus.GetStats());
	Publish();

	FmtInfo(blast_domain, "discovered {} devices in {} ms",
		devices.size(), bus.GetDuration().count());

	if (mode == Mode::DISCOVER_ONLY) {
		reuse_devices = true;
		SetState(BlastState::IDLE);
	} else
		StartControl();
}

void
BlastService::StartControl() noexcept
{
	SetState(BlastState::CONTROLLING);

	if (media_url.empty()) {
		Fail(std::make_exception_ptr(std::runtime_error("No media URL")));
		return;
	}

	phase_start = event_loop.SteadyNow();
	queue.assign(devices.begin(), devices.end());

	FillSlots();

	if (tasks.empty() && queue.empty())
		defer_settled.Schedule();
}

void
BlastService::FillSlots() noexcept
{
	while (tasks.size() < concurrency && !queue.empty()) {
		auto *task = new ControlTask(*this, std::move(queue.front()));
		queue.pop_front();

		metrics.AddAttempt();
		observer.OnDeviceStatus(task->device, DeviceStatus::CONNECTING);

		try {
			task->Start(control, media_url);
		} catch (...) {
			auto result = ControlResult::Failure(task->device.GetKey(),
							     {},
							     std::current_exception());
			FmtWarning(blast_domain, "{} failed: {}",
				   task->device.GetDisplayName(),
				   result.error);
			metrics.AddResult(task->device, result);
			observer.OnDeviceStatus(task->device, DeviceStatus::FAILED);
			delete task;
			continue;
		}

		tasks.push_back(*task);
		peak_concurrency = std::max<unsigned>(peak_concurrency,
						      tasks.size());
	}

	Publish();
}

void
BlastService::OnTaskDone(ControlTask &task, ControlResult &&result) noexcept
{
	Device device = std::move(task.device);
	tasks.erase(tasks.iterator_to(task));

	/* this also destroys the ControlOperation which has just
	   invoked us; it does not touch itself after the handler
	   returns */
	delete &task;

	if (result.succeeded)
		FmtInfo(blast_domain, "{} playing after {} ms",
			device.GetDisplayName(), result.duration.count());
	else
		FmtWarning(blast_domain, "{} failed: {}",
			   device.GetDisplayName(), result.error);

	metrics.AddResult(device, result);
	observer.OnDeviceStatus(device,
				result.succeeded
				? DeviceStatus::SUCCESS
				: DeviceStatus::FAILED);

	FillSlots();

	if (tasks.empty() && queue.empty())
		defer_settled.Schedule();
}

void
BlastService::OnSettled() noexcept
{
	if (state == BlastState::CONTROLLING)
		Summarize();
}

void
BlastService::Summarize() noexcept
{
	SetState(BlastState::SUMMARIZING);

	metrics.Complete(GetPhaseElapsed());
	Publish();

	const auto &m = metrics.Get();
	FmtNotice(blast_domain,
		  "blast complete: {} of {} devices playing ({:.0f}%) in {} ms",
		  m.successes, m.attempts, m.GetSuccessRate() * 100,
		  m.total_blast_duration.count());

	observer.OnBlastSummary(m);

	media_server.Stop();
	media_url.clear();

	SetState(BlastState::DONE);
	defer_reset.Schedule();
}

void
BlastService::OnDeferredReset() noexcept
{
	Reset();
}

void
BlastService::Reset() noexcept
{
	if (state != BlastState::DONE)
		return;

	defer_reset.Cancel();
	reuse_devices = false;
	SetState(BlastState::IDLE);
}

void
BlastService::Cleanup() noexcept
{
	bus.Cancel();
	defer_settled.Cancel();
	defer_reset.Cancel();

	/* discard the results of control attempts in progress */
	tasks.clear_and_dispose([](ControlTask *task){ delete task; });
	queue.clear();

	media_server.Stop();
	media_url.clear();
	reuse_devices = false;
}

void
BlastService::Stop() noexcept
{
	if (state != BlastState::IDLE)
		FmtInfo(blast_domain, "stopping ({})", ToString(state));

	Cleanup();
	SetState(BlastState::IDLE);
}

void
BlastService::Fail(std::exception_ptr error) noexcept
{
	FmtError(blast_domain, "blast failed: {}", error);

	Cleanup();
	observer.OnBlastError(std::move(error));
	SetState(BlastState::IDLE);
}
