// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "discovery/Stats.hxx"
#include "device/Device.hxx"

#include <array>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct ControlResult;

/**
 * The result of one control attempt as recorded in the metrics.
 */
struct DeviceControlRecord {
	DeviceKey key;
	std::string name;
	std::string manufacturer;
	DiscoveryMethod method;

	bool succeeded;
	std::chrono::milliseconds duration;

	/**
	 * The error message; empty on success.
	 */
	std::string error;
};

/**
 * Success counters of one group of devices (one manufacturer or one
 * discovery method).
 */
struct ControlCounters {
	unsigned attempts = 0, successes = 0;

	/**
	 * Between 0 and 1; 0 if there were no attempts.
	 */
	[[gnu::pure]]
	double GetSuccessRatio() const noexcept {
		return attempts > 0
			? double(successes) / attempts
			: 0.;
	}
};

/**
 * A consistent view of the metrics of a blast.  Instances are
 * published as std::shared_ptr<const MetricsSnapshot> and are never
 * modified afterwards.
 */
struct MetricsSnapshot {
	/**
	 * The time it took the media server to become ready.
	 */
	std::chrono::milliseconds serve_startup{};

	std::chrono::milliseconds discovery_duration{};

	/**
	 * The time from the first control attempt until the last
	 * one has settled.
	 */
	std::chrono::milliseconds total_blast_duration{};

	unsigned devices_discovered = 0;

	/**
	 * Control attempts started, including the ones still in
	 * progress.
	 */
	unsigned attempts = 0;

	unsigned successes = 0, failures = 0;

	/**
	 * In completion order.
	 */
	std::vector<DeviceControlRecord> device_results;

	std::map<std::string, ControlCounters, std::less<>> manufacturers;

	std::array<ControlCounters, N_DISCOVERY_METHODS> methods{};

	DiscoveryStats discovery;

	/**
	 * Has the blast been summarized?  The snapshot will not
	 * change anymore.
	 */
	bool complete = false;

	unsigned GetSettled() const noexcept {
		return successes + failures;
	}

	unsigned GetInFlight() const noexcept {
		return attempts - GetSettled();
	}

	/**
	 * Between 0 and 1.
	 */
	[[gnu::pure]]
	double GetSuccessRate() const noexcept {
		const unsigned settled = GetSettled();
		return settled > 0
			? double(successes) / settled
			: 0.;
	}

	/**
	 * The average duration of successful attempts.
	 */
	[[gnu::pure]]
	std::chrono::milliseconds GetAverageSoapTime() const noexcept;

	/**
	 * The fastest successful attempt or nullptr.
	 */
	[[gnu::pure]]
	const DeviceControlRecord *GetFastest() const noexcept;

	[[gnu::pure]]
	const DeviceControlRecord *GetSlowest() const noexcept;
};

/**
 * Collects metrics during a blast.  Owned by the orchestrator (a
 * single writer); readers get immutable copies from Publish().
 */
class MetricsAccumulator {
	MetricsSnapshot current;

public:
	const MetricsSnapshot &Get() const noexcept {
		return current;
	}

	void Reset() noexcept {
		current = {};
	}

	void SetServeStartup(std::chrono::milliseconds duration) noexcept {
		current.serve_startup = duration;
	}

	void SetDevicesDiscovered(unsigned n) noexcept {
		current.devices_discovered = n;
	}

	void SetDiscovery(std::chrono::milliseconds duration,
			  unsigned devices,
			  const DiscoveryStats &stats) noexcept {
		current.discovery_duration = duration;
		current.devices_discovered = devices;
		current.discovery = stats;
	}

	void AddAttempt() noexcept {
		++current.attempts;
	}

	void AddResult(const Device &device,
		       const ControlResult &result) noexcept;

	/**
	 * Freeze the metrics.
	 */
	void Complete(std::chrono::milliseconds total_blast_duration) noexcept {
		current.total_blast_duration = total_blast_duration;
		current.complete = true;
	}

	/**
	 * Create an immutable copy.
	 */
	std::shared_ptr<const MetricsSnapshot> Publish() const {
		return std::make_shared<const MetricsSnapshot>(current);
	}
};
