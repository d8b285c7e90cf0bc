// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Thread.hxx"

#include <cassert>

#include <pthread.h>

void
EventThread::Start()
{
	assert(!event_loop.IsAlive());
	assert(!thread.joinable());

	event_loop.SetAlive(true);

	thread = std::thread(&EventThread::Run, this);
}

void
EventThread::Stop() noexcept
{
	if (thread.joinable()) {
		assert(event_loop.IsAlive());
		event_loop.SetAlive(false);

		event_loop.InjectBreak();
		thread.join();
	}
}

void
EventThread::Run() noexcept
{
	pthread_setname_np(pthread_self(), "event");

	event_loop.SetThread(std::this_thread::get_id());
	event_loop.Run();
}
