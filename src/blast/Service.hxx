// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "State.hxx"
#include "Metrics.hxx"
#include "MediaServer.hxx"
#include "discovery/Bus.hxx"
#include "event/DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct BlastConfig;
class DiscovererFactory;
class DeviceControl;
class BlastObserver;

/**
 * The blast orchestrator: starts the media server, discovers
 * devices and sends the clip to all of them with a limited number
 * of simultaneous control attempts.
 *
 * All methods except GetMetrics() must be called in the #EventLoop
 * thread.
 */
class BlastService final : DiscoveryBusListener, MediaServerHandler {
	class ControlTask;

	EventLoop &event_loop;

	const unsigned concurrency;
	const Event::Duration discovery_timeout;

	DiscovererFactory &discoverer_factory;
	DeviceControl &control;
	MediaServer &media_server;
	BlastObserver &observer;

	DiscoveryBus bus;

	/**
	 * Summarizes after the last control attempt has settled;
	 * deferred to get out of the control callback.
	 */
	DeferEvent defer_settled;

	/**
	 * Returns from #BlastState::DONE to #BlastState::IDLE.
	 */
	DeferEvent defer_reset;

	enum class Mode : uint8_t {
		BLAST,
		DISCOVER_ONLY,
		SINGLE,
	} mode = Mode::BLAST;

	BlastState state = BlastState::IDLE;

	std::string media_url;

	/**
	 * The devices of the last discovery run.
	 */
	std::vector<Device> devices;

	/**
	 * Set by a discover-only run: the next blast uses #devices
	 * instead of discovering again.
	 */
	bool reuse_devices = false;

	/**
	 * Devices waiting for a free control slot.
	 */
	std::deque<Device> queue;

	boost::intrusive::list<ControlTask,
			       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>>>,
			       boost::intrusive::constant_time_size<true>> tasks;

	/**
	 * The highest number of simultaneous control attempts in
	 * this run.
	 */
	unsigned peak_concurrency = 0;

	Event::TimePoint phase_start;

	MetricsAccumulator metrics;

	mutable std::mutex snapshot_mutex;
	std::shared_ptr<const MetricsSnapshot> snapshot;

public:
	BlastService(EventLoop &_event_loop, const BlastConfig &config,
		     DiscovererFactory &_discoverer_factory,
		     DeviceControl &_control,
		     MediaServer &_media_server,
		     BlastObserver &_observer);
	~BlastService() noexcept;

	BlastService(const BlastService &) = delete;
	BlastService &operator=(const BlastService &) = delete;

	BlastState GetState() const noexcept {
		return state;
	}

	/**
	 * Serve, discover (or reuse the devices of a discover-only
	 * run), control all devices, summarize.
	 *
	 * Throws std::runtime_error if the service is not idle.
	 */
	void StartBlast();

	/**
	 * Discover devices and return to #BlastState::IDLE.
	 *
	 * Throws std::runtime_error if the service is not idle.
	 */
	void StartDiscoverOnly();

	/**
	 * Serve and control just this one device.  If it is already
	 * known from a discovery run, the known record is used.
	 *
	 * Throws std::runtime_error if the service is not idle.
	 */
	void StartSingle(const Device &device);

	/**
	 * Cancel everything and return to #BlastState::IDLE.
	 * Results of control attempts still in progress are
	 * discarded.
	 */
	void Stop() noexcept;

	/**
	 * Return from #BlastState::DONE to #BlastState::IDLE.
	 */
	void Reset() noexcept;

	const std::vector<Device> &GetDevices() const noexcept {
		return devices;
	}

	unsigned GetPeakConcurrency() const noexcept {
		return peak_concurrency;
	}

	/**
	 * Returns the most recently published metrics.  This method
	 * is thread-safe.
	 */
	std::shared_ptr<const MetricsSnapshot> GetMetrics() const noexcept {
		const std::scoped_lock lock{snapshot_mutex};
		return snapshot;
	}

private:
	void CheckIdle() const;

	void SetState(BlastState new_state) noexcept;
	void Publish() noexcept;

	std::chrono::milliseconds GetPhaseElapsed() noexcept;

	void StartServing() noexcept;
	void StartDiscovery() noexcept;
	void StartControl() noexcept;
	void FillSlots() noexcept;
	void Summarize() noexcept;

	void Cleanup() noexcept;
	void Fail(std::exception_ptr error) noexcept;

	void OnTaskDone(ControlTask &task, ControlResult &&result) noexcept;

	/* callback for #defer_settled */
	void OnSettled() noexcept;

	/* callback for #defer_reset */
	void OnDeferredReset() noexcept;

	/* virtual methods from class DiscoveryBusListener */
	void OnBusDevice(const Device &device, bool is_new) noexcept override;
	void OnBusDescriptionProgress(unsigned in_flight,
				      unsigned completed) noexcept override;
	void OnBusFinished() noexcept override;

	/* virtual methods from class MediaServerHandler */
	void OnMediaServerReady(std::string url) noexcept override;
	void OnMediaServerError(std::exception_ptr error) noexcept override;
};
