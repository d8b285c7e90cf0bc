// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Chrono.hxx"
#include "TimerList.hxx"
#include "SocketEvent.hxx"
#include "DeferEvent.hxx"
#include "InjectEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <mutex>
#include <optional>
#include <thread>

/**
 * An event loop that polls for events on sockets (epoll), runs
 * timers and deferred calls.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs it, except where explicitly documented as
 * thread-safe.
 *
 * @see SocketEvent, FineTimerEvent, DeferEvent, InjectEvent
 */
class EventLoop final
{
	int epoll_fd;

	/**
	 * An eventfd which wakes up epoll_wait() when an
	 * #InjectEvent was scheduled from another thread.
	 */
	int wake_fd;

	SocketEvent wake_event;

	TimerList timers;

	template<typename T>
	using AutoUnlinkList =
		boost::intrusive::list<T, boost::intrusive::constant_time_size<false>>;

	AutoUnlinkList<DeferEvent> defer;

	/**
	 * #SocketEvent instances which have a non-zero "ready_flags"
	 * field and need to be dispatched.
	 */
	AutoUnlinkList<SocketEvent> ready_sockets;

	std::mutex mutex;

	/**
	 * Protected with #mutex.
	 */
	boost::intrusive::list<InjectEvent> inject;

	/**
	 * The thread that is currently inside Run().
	 */
	std::thread::id thread;

	/**
	 * Is this #EventLoop alive, i.e. can events be scheduled?
	 * This is used by BlockingCall() to determine whether to
	 * schedule in the #EventThread or to call directly (if
	 * there's no #EventThread yet/anymore).
	 */
	bool alive;

	bool quit = false;

	/**
	 * True when the object has been modified and another check is
	 * necessary before going to sleep.
	 */
	bool again;

	/**
	 * Protected with #mutex.
	 */
	bool quit_injected = false;

	/**
	 * True when handling callbacks, false when waiting for I/O or
	 * timeout.  Protected with #mutex.
	 */
	bool busy = true;

	std::optional<Event::TimePoint> steady_now;

public:
	struct NoThread {};

	/**
	 * Construct an #EventLoop for the current thread.
	 *
	 * Throws on error.
	 */
	EventLoop();

	/**
	 * Construct an #EventLoop which will be run by an
	 * #EventThread later.
	 */
	explicit EventLoop(NoThread);

	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	/**
	 * Caching wrapper for std::chrono::steady_clock::now().  The
	 * real clock is queried at most once per event loop
	 * iteration.
	 */
	Event::TimePoint SteadyNow() noexcept {
		if (!steady_now)
			steady_now = Event::Clock::now();
		return *steady_now;
	}

	/**
	 * Stop execution of this #EventLoop at the next chance.
	 *
	 * This method is not thread-safe.  For stopping the
	 * #EventLoop from within another thread, use InjectBreak().
	 */
	void Break() noexcept {
		quit = true;
	}

	/**
	 * Like Break(), but thread-safe.
	 */
	void InjectBreak() noexcept;

	bool AddFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool RemoveFD(int fd, SocketEvent &event) noexcept;

	void Insert(FineTimerEvent &t) noexcept;

	/**
	 * Schedule a call to DeferEvent::Run().
	 */
	void AddDefer(DeferEvent &e) noexcept;

	/**
	 * Schedule a call to the #InjectEvent.
	 *
	 * This method is thread-safe.
	 */
	void AddInject(InjectEvent &e) noexcept;

	/**
	 * Cancel a pending call to the #InjectEvent.
	 *
	 * This method is thread-safe.
	 */
	void RemoveInject(InjectEvent &e) noexcept;

	/**
	 * The main function of this class.  It will loop until
	 * Break() gets called.
	 */
	void Run() noexcept;

	void SetThread(std::thread::id _thread) noexcept {
		thread = _thread;
	}

	void SetAlive(bool _alive) noexcept {
		alive = _alive;
	}

	bool IsAlive() const noexcept {
		return alive;
	}

	/**
	 * Are we currently running inside this EventLoop's thread?
	 */
	[[gnu::pure]]
	bool IsInside() const noexcept {
		return thread == std::this_thread::get_id();
	}

private:
	void RunDeferred() noexcept;

	/**
	 * Invoke all pending InjectEvents.
	 *
	 * Caller must lock the mutex.
	 */
	void HandleInject(std::unique_lock<std::mutex> &lock) noexcept;

	/**
	 * Call epoll_wait() and move all returned events to
	 * #ready_sockets.
	 */
	void Wait(Event::Duration timeout) noexcept;

	void OnWake(unsigned flags) noexcept;
};
