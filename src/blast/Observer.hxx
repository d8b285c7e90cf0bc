// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "State.hxx"
#include "device/Device.hxx"

#include <exception>
#include <memory>

struct MetricsSnapshot;

/**
 * Receives progress reports of a #BlastService.  All methods are
 * invoked in the #EventLoop thread.  They must not call
 * BlastService::Stop() or start a new run; use a DeferEvent for
 * that.
 */
class BlastObserver {
public:
	virtual void OnBlastState(BlastState state) noexcept = 0;

	/**
	 * A new metrics snapshot has been published.
	 */
	virtual void OnBlastMetrics(std::shared_ptr<const MetricsSnapshot> metrics) noexcept = 0;

	/**
	 * A device has been found or has changed its status.
	 */
	virtual void OnDeviceStatus(const Device &device,
				    DeviceStatus status) noexcept = 0;

	/**
	 * The blast has failed (e.g. there is no media URL); the
	 * service returns to #BlastState::IDLE.
	 */
	virtual void OnBlastError(std::exception_ptr error) noexcept = 0;

	/**
	 * The final snapshot of a blast, delivered when entering
	 * #BlastState::SUMMARIZING.
	 */
	virtual void OnBlastSummary(const MetricsSnapshot &metrics) noexcept = 0;
};
