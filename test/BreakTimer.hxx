// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "event/Loop.hxx"
#include "event/FineTimerEvent.hxx"

/**
 * Breaks the #EventLoop after the given duration; this limits how
 * long a test may run.
 */
class BreakTimer final {
	EventLoop &event_loop;
	FineTimerEvent timer;

public:
	bool expired = false;

	BreakTimer(EventLoop &_event_loop, Event::Duration d) noexcept
		:event_loop(_event_loop),
		 timer(event_loop, BIND_THIS_METHOD(OnTimer))
	{
		timer.Schedule(d);
	}

private:
	void OnTimer() noexcept {
		expired = true;
		event_loop.Break();
	}
};

/**
 * Run the #EventLoop for the given duration.
 */
inline void
RunFor(EventLoop &event_loop, Event::Duration d) noexcept
{
	BreakTimer timer(event_loop, d);
	event_loop.Run();
}
