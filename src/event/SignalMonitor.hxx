// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "SocketEvent.hxx"
#include "util/BindMethod.hxx"

#include <signal.h>

/**
 * Receives POSIX signals through a signalfd and invokes a callback
 * inside the #EventLoop.
 */
class SignalMonitor final {
	using Callback = BoundMethod<void(int signo) noexcept>;

	SocketEvent event;

	const Callback callback;

	sigset_t mask;

public:
	SignalMonitor(EventLoop &_loop, Callback _callback) noexcept;

	/**
	 * Closes the signalfd and unblocks all registered signals.
	 */
	~SignalMonitor() noexcept;

	SignalMonitor(const SignalMonitor &) = delete;
	SignalMonitor &operator=(const SignalMonitor &) = delete;

	/**
	 * Block the specified signal and deliver it to the callback
	 * instead.
	 *
	 * Throws on error.
	 */
	void Register(int signo);

private:
	void OnSocketReady(unsigned flags) noexcept;
};
