// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Listener.hxx"
#include "Stats.hxx"
#include "device/Device.hxx"
#include "device/Merge.hxx"
#include "event/FineTimerEvent.hxx"
#include "event/DeferEvent.hxx"

#include <array>
#include <memory>
#include <vector>

class EventLoop;
class Discoverer;
class DiscovererFactory;

/**
 * Receives the merged output of a #DiscoveryBus.  All methods are
 * invoked in the #EventLoop thread.
 */
class DiscoveryBusListener {
public:
	/**
	 * A device was found (#is_new) or the merged record of a
	 * known device has changed.
	 */
	virtual void OnBusDevice(const Device &device,
				 bool is_new) noexcept = 0;

	virtual void OnBusDescriptionProgress(unsigned in_flight,
					      unsigned completed) noexcept = 0;

	/**
	 * Discovery is over: the deadline has expired or all
	 * discoverers have finished.  Late updates may still arrive
	 * through OnBusDevice() until the bus is cancelled.  The
	 * method may destroy the #DiscoveryBus.
	 */
	virtual void OnBusFinished() noexcept = 0;
};

/**
 * Runs several #Discoverer instances concurrently under a shared
 * deadline and merges their output into one device list keyed by
 * address and port.
 */
class DiscoveryBus final : DiscoveryListener {
	EventLoop &event_loop;

	DiscoveryBusListener &listener;

	const MergePolicy policy;

	/**
	 * Expires at the discovery deadline.
	 */
	FineTimerEvent deadline_timer;

	/**
	 * Finishes the run after all discoverers have finished early.
	 * Deferred, because that is noticed inside a discoverer
	 * callback.
	 */
	DeferEvent defer_finish;

	std::vector<std::unique_ptr<Discoverer>> discoverers;

	/**
	 * All merged devices in the order of their first appearance.
	 */
	std::vector<Device> devices;

	DiscoveryStats stats;

	std::array<bool, N_DISCOVERY_METHODS> active{};

	Event::TimePoint start_time;

	std::chrono::milliseconds duration{};

	enum class State : uint8_t {
		IDLE,
		RUNNING,
		FINISHED,
	} state = State::IDLE;

public:
	DiscoveryBus(EventLoop &_event_loop, MergePolicy _policy,
		     DiscoveryBusListener &_listener) noexcept;
	~DiscoveryBus() noexcept;

	DiscoveryBus(const DiscoveryBus &) = delete;
	DiscoveryBus &operator=(const DiscoveryBus &) = delete;

	/**
	 * Start all discoverers created by the factory.  A discoverer
	 * whose Start() method throws is logged and skipped.
	 *
	 * Throws if the factory throws.
	 */
	void Start(DiscovererFactory &factory, Event::Duration timeout);

	/**
	 * Stop everything, including enrichment which is still in
	 * progress.  No more listener calls will be made.
	 */
	void Cancel() noexcept;

	bool IsRunning() const noexcept {
		return state == State::RUNNING;
	}

	bool IsFinished() const noexcept {
		return state == State::FINISHED;
	}

	const std::vector<Device> &GetDevices() const noexcept {
		return devices;
	}

	[[gnu::pure]]
	const Device *Find(const DeviceKey &key) const noexcept;

	const DiscoveryStats &GetStats() const noexcept {
		return stats;
	}

	/**
	 * The duration of the last run (valid after it finished).
	 */
	std::chrono::milliseconds GetDuration() const noexcept {
		return duration;
	}

private:
	[[gnu::pure]]
	std::chrono::milliseconds GetElapsed() const noexcept;

	[[gnu::pure]]
	bool IsAnyActive() const noexcept;

	void Deactivate(DiscoveryMethod method) noexcept;

	void Merge(Device &&device) noexcept;

	void Finish() noexcept;

	void OnDeadline() noexcept;
	void OnDeferredFinish() noexcept;

	/* virtual methods from class DiscoveryListener */
	void OnDeviceFound(Device &&device) noexcept override;
	void OnDeviceUpdate(Device &&device) noexcept override;
	void OnDescriptionProgress(unsigned in_flight,
				   unsigned completed) noexcept override;
	void OnDiscovererFinished(DiscoveryMethod method) noexcept override;
	void OnDiscovererError(DiscoveryMethod method,
			       std::exception_ptr error) noexcept override;
};
