// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "util/BindMethod.hxx"

#include <boost/intrusive/list_hook.hpp>

class EventLoop;

/**
 * Invoke a method call in the #EventLoop from any thread.
 *
 * This class is thread-safe.
 */
class InjectEvent final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::safe_link>>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	InjectEvent(EventLoop &_loop, Callback _callback) noexcept
		:loop(_loop), callback(_callback) {}

	~InjectEvent() noexcept {
		Cancel();
	}

	InjectEvent(const InjectEvent &) = delete;
	InjectEvent &operator=(const InjectEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	void Schedule() noexcept;

	/**
	 * Cancel a pending call.  After returning, the call may
	 * still be running in the #EventLoop thread.
	 */
	void Cancel() noexcept;

private:
	void Run() noexcept {
		callback();
	}
};
