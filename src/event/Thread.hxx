// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Loop.hxx"

#include <thread>

/**
 * A thread which runs an #EventLoop.
 */
class EventThread final {
	EventLoop event_loop{EventLoop::NoThread{}};

	std::thread thread;

public:
	EventThread() = default;

	~EventThread() noexcept {
		Stop();
	}

	EventLoop &GetEventLoop() noexcept {
		return event_loop;
	}

	void Start();

	void Stop() noexcept;

private:
	void Run() noexcept;
};
