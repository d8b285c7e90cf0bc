// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "device/Device.hxx"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

/**
 * The outcome of one control attempt.
 */
struct ControlResult {
	DeviceKey device;

	bool succeeded = false;

	std::chrono::milliseconds duration{};

	/**
	 * A human-readable error message; empty on success.
	 */
	std::string error;

	static ControlResult Success(DeviceKey _device,
				     std::chrono::milliseconds _duration) noexcept {
		return {std::move(_device), true, _duration, {}};
	}

	static ControlResult Failure(DeviceKey _device,
				     std::chrono::milliseconds _duration,
				     std::string _error) noexcept {
		return {std::move(_device), false, _duration, std::move(_error)};
	}

	/**
	 * Build a failure from an exception; the error message
	 * contains all nested messages.
	 */
	static ControlResult Failure(DeviceKey _device,
				     std::chrono::milliseconds _duration,
				     std::exception_ptr e) noexcept;
};
