// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <memory>
#include <string_view>

struct Device;
struct ControlResult;

/**
 * Receives the result of a #ControlOperation.
 */
class ControlHandler {
public:
	/**
	 * The operation has completed (successfully or not).  The
	 * method may destroy the #ControlOperation.
	 */
	virtual void OnControlResult(ControlResult &&result) noexcept = 0;
};

/**
 * An asynchronous control operation on one device.  Destroying the
 * object cancels the operation; the handler will not be invoked
 * after that.
 */
class ControlOperation {
public:
	virtual ~ControlOperation() noexcept = default;
};

/**
 * Sends a media clip to renderers.
 */
class DeviceControl {
public:
	virtual ~DeviceControl() noexcept = default;

	/**
	 * Make the device play the given URL.  The result is
	 * delivered to the handler asynchronously, never from inside
	 * this method.
	 *
	 * Throws on (local) error.
	 */
	virtual std::unique_ptr<ControlOperation>
	PushClip(const Device &device, std::string_view media_url,
		 ControlHandler &handler) = 0;
};
