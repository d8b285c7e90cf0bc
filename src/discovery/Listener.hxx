// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "device/Method.hxx"

#include <exception>

struct Device;

/**
 * Receives the output of a #Discoverer.  All methods are invoked in
 * the #EventLoop thread.
 */
class DiscoveryListener {
public:
	/**
	 * A device was found.  Each discoverer reports a given
	 * (address, port) only once.
	 */
	virtual void OnDeviceFound(Device &&device) noexcept = 0;

	/**
	 * Additional information about a device which was
	 * previously reported by OnDeviceFound() has arrived.  This
	 * may happen after the discoverer was stopped.
	 */
	virtual void OnDeviceUpdate(Device &&device) noexcept = 0;

	/**
	 * Progress of asynchronous description downloads.
	 */
	virtual void OnDescriptionProgress(unsigned in_flight,
					   unsigned completed) noexcept = 0;

	/**
	 * The discoverer has nothing more to report (but may still
	 * deliver OnDeviceUpdate()).
	 */
	virtual void OnDiscovererFinished(DiscoveryMethod method) noexcept = 0;

	/**
	 * The discoverer has failed fatally.  It will not report
	 * anything after this call.
	 */
	virtual void OnDiscovererError(DiscoveryMethod method,
				       std::exception_ptr error) noexcept = 0;
};
