// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Result.hxx"
#include "util/Exception.hxx"

ControlResult
ControlResult::Failure(DeviceKey _device, std::chrono::milliseconds _duration,
		       std::exception_ptr e) noexcept
{
	return Failure(std::move(_device), _duration, GetFullMessage(e));
}
