// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Bus.hxx"
#include "Discoverer.hxx"
#include "Factory.hxx"
#include "event/Loop.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <algorithm>
#include <cassert>

static constexpr Domain discovery_domain("discovery");

DiscoveryBus::DiscoveryBus(EventLoop &_event_loop, MergePolicy _policy,
			   DiscoveryBusListener &_listener) noexcept
	:event_loop(_event_loop), listener(_listener),
	 policy(std::move(_policy)),
	 deadline_timer(event_loop, BIND_THIS_METHOD(OnDeadline)),
	 defer_finish(event_loop, BIND_THIS_METHOD(OnDeferredFinish))
{
}

DiscoveryBus::~DiscoveryBus() noexcept
{
	Cancel();
}

void
DiscoveryBus::Start(DiscovererFactory &factory, Event::Duration timeout)
{
	assert(state != State::RUNNING);

	Cancel();

	devices.clear();
	stats = {};
	active = {};
	duration = {};

	discoverers = factory.CreateDiscoverers(*this);

	start_time = event_loop.SteadyNow();
	state = State::RUNNING;

	for (auto i = discoverers.begin(); i != discoverers.end();) {
		auto &d = **i;
		const auto method = d.GetMethod();
		auto &s = stats[method];
		s.enabled = true;

		try {
			d.Start();
			active[std::size_t(method)] = true;
			FmtDebug(discovery_domain, "{} discovery started",
				 ToString(method));
			++i;
		} catch (...) {
			/* a resource error is fatal for this method,
			   but the others continue */
			FmtError(discovery_domain, "{} discovery failed: {}",
				 ToString(method), std::current_exception());
			s.failed = true;
			i = discoverers.erase(i);
		}
	}

	if (IsAnyActive())
		deadline_timer.Schedule(timeout);
	else
		defer_finish.Schedule();
}

void
DiscoveryBus::Cancel() noexcept
{
	deadline_timer.Cancel();
	defer_finish.Cancel();

	/* this cancels all pending description downloads */
	discoverers.clear();

	if (state == State::RUNNING)
		duration = GetElapsed();

	active = {};
	state = State::IDLE;
}

const Device *
DiscoveryBus::Find(const DeviceKey &key) const noexcept
{
	auto i = std::find_if(devices.begin(), devices.end(),
			      [&key](const Device &d){
				      return d.GetKey() == key;
			      });
	return i != devices.end() ? &*i : nullptr;
}

std::chrono::milliseconds
DiscoveryBus::GetElapsed() const noexcept
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(event_loop.SteadyNow() - start_time);
}

bool
DiscoveryBus::IsAnyActive() const noexcept
{
	return std::any_of(active.begin(), active.end(),
			   [](bool b){ return b; });
}

void
DiscoveryBus::Deactivate(DiscoveryMethod method) noexcept
{
	auto &a = active[std::size_t(method)];
	if (!a)
		return;

	a = false;
	stats[method].duration = GetElapsed();

	if (state == State::RUNNING && !IsAnyActive())
		defer_finish.Schedule();
}

void
DiscoveryBus::Merge(Device &&device) noexcept
{
	auto i = std::find_if(devices.begin(), devices.end(),
			      [key = device.GetKey()](const Device &d){
				      return d.GetKey() == key;
			      });
	if (i == devices.end()) {
		++stats[device.method].devices_found;

		FmtDebug(discovery_domain, "found {} via {}",
			 device.GetDisplayName(), ToString(device.method));

		const Device &d = devices.emplace_back(std::move(device));
		listener.OnBusDevice(d, true);
		return;
	}

	if (MergeDevice(*i, device, policy)) {
		FmtDebug(discovery_domain, "merged {} via {} ({} metadata fields)",
			 i->GetDisplayName(), ToString(device.method),
			 i->metadata.size());
		listener.OnBusDevice(*i, false);
	}
}

void
DiscoveryBus::Finish() noexcept
{
	assert(state == State::RUNNING);

	deadline_timer.Cancel();
	defer_finish.Cancel();

	duration = GetElapsed();

	for (const auto method : all_discovery_methods)
		if (active[std::size_t(method)]) {
			active[std::size_t(method)] = false;
			stats[method].duration = duration;
		}

	/* stop searching, but let description downloads continue */
	for (auto &d : discoverers)
		d->Stop();

	state = State::FINISHED;

	FmtInfo(discovery_domain, "discovery finished after {} ms: {} devices",
		duration.count(), devices.size());

	listener.OnBusFinished();
}

void
DiscoveryBus::OnDeadline() noexcept
{
	Finish();
}

void
DiscoveryBus::OnDeferredFinish() noexcept
{
	if (state == State::RUNNING)
		Finish();
}

void
DiscoveryBus::OnDeviceFound(Device &&device) noexcept
{
	if (state != State::RUNNING)
		return;

	Merge(std::move(device));
}

void
DiscoveryBus::OnDeviceUpdate(Device &&device) noexcept
{
	/* late updates after the deadline are legal */
	if (state == State::IDLE)
		return;

	Merge(std::move(device));
}

void
DiscoveryBus::OnDescriptionProgress(unsigned in_flight,
				    unsigned completed) noexcept
{
	if (state == State::IDLE)
		return;

	listener.OnBusDescriptionProgress(in_flight, completed);
}

void
DiscoveryBus::OnDiscovererFinished(DiscoveryMethod method) noexcept
{
	FmtDebug(discovery_domain, "{} discovery finished", ToString(method));
	Deactivate(method);
}

void
DiscoveryBus::OnDiscovererError(DiscoveryMethod method,
				std::exception_ptr error) noexcept
{
	FmtError(discovery_domain, "{} discovery failed: {}",
		 ToString(method), error);
	stats[method].failed = true;
	Deactivate(method);
}
