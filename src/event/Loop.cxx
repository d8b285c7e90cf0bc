// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Loop.hxx"

#include <array>
#include <cassert>
#include <cerrno>
#include <cstdint>
#include <system_error>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

static int
CreateEpoll()
{
	int fd = epoll_create1(EPOLL_CLOEXEC);
	if (fd < 0)
		throw std::system_error(errno, std::system_category(),
					"epoll_create1() failed");
	return fd;
}

static int
CreateEventFD()
{
	int fd = eventfd(0, EFD_NONBLOCK|EFD_CLOEXEC);
	if (fd < 0)
		throw std::system_error(errno, std::system_category(),
					"eventfd() failed");
	return fd;
}

EventLoop::EventLoop(NoThread)
	:epoll_fd(CreateEpoll()),
	 wake_fd(CreateEventFD()),
	 wake_event(*this, BIND_THIS_METHOD(OnWake), SocketDescriptor(wake_fd)),
	 alive(false)
{
}

EventLoop::EventLoop()
	:EventLoop(NoThread{})
{
	/* the main EventLoop instance is alive right away, because
	   nobody but EventThread will call SetAlive() */
	thread = std::this_thread::get_id();
	alive = true;
}

EventLoop::~EventLoop() noexcept
{
	assert(defer.empty());
	assert(inject.empty());
	assert(ready_sockets.empty());

	wake_event.Cancel();
	close(wake_fd);
	close(epoll_fd);
}

bool
EventLoop::AddFD(int fd, unsigned events, SocketEvent &event) noexcept
{
	assert(!IsAlive() || IsInside());

	struct epoll_event e{};
	e.events = events;
	e.data.ptr = &event;
	return epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &e) == 0;
}

bool
EventLoop::ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept
{
	assert(!IsAlive() || IsInside());

	struct epoll_event e{};
	e.events = events;
	e.data.ptr = &event;
	return epoll_ctl(epoll_fd, EPOLL_CTL_MOD, fd, &e) == 0;
}

bool
EventLoop::RemoveFD(int fd, SocketEvent &event) noexcept
{
	assert(!IsAlive() || IsInside());

	/* an event which was canceled after epoll_wait() reported it
	   must not be dispatched anymore */
	event.unlink();

	return epoll_ctl(epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == 0;
}

void
EventLoop::Insert(FineTimerEvent &t) noexcept
{
	assert(!IsAlive() || IsInside());

	timers.Insert(t);
	again = true;
}

void
EventLoop::AddDefer(DeferEvent &e) noexcept
{
	assert(!IsAlive() || IsInside());

	defer.push_back(e);
	again = true;
}

void
EventLoop::AddInject(InjectEvent &e) noexcept
{
	bool must_wake;

	{
		const std::scoped_lock lock{mutex};
		if (e.is_linked())
			return;

		/* we don't need to wake up the EventLoop if another
		   InjectEvent has already done it */
		must_wake = !busy && inject.empty();

		inject.push_back(e);
	}

	if (must_wake) {
		const uint64_t value = 1;
		[[maybe_unused]] auto nbytes = write(wake_fd, &value, sizeof(value));
	}
}

void
EventLoop::RemoveInject(InjectEvent &e) noexcept
{
	const std::scoped_lock lock{mutex};

	if (e.is_linked())
		inject.erase(inject.iterator_to(e));
}

void
EventLoop::InjectBreak() noexcept
{
	{
		const std::scoped_lock lock{mutex};
		quit_injected = true;
	}

	const uint64_t value = 1;
	[[maybe_unused]] auto nbytes = write(wake_fd, &value, sizeof(value));
}

void
EventLoop::RunDeferred() noexcept
{
	while (!defer.empty() && !quit) {
		auto &e = defer.front();
		defer.pop_front();
		e.Run();
	}
}

void
EventLoop::HandleInject(std::unique_lock<std::mutex> &lock) noexcept
{
	while (!inject.empty() && !quit) {
		auto &e = inject.front();
		inject.pop_front();

		lock.unlock();
		e.Run();
		lock.lock();
	}
}

/**
 * Convert the given timeout specification to a milliseconds integer
 * for epoll_wait().  Any negative value (= never times out) is
 * translated to the magic value -1.
 */
static constexpr int
ExportTimeoutMS(Event::Duration timeout) noexcept
{
	return timeout >= timeout.zero()
		? static_cast<int>(std::chrono::ceil<std::chrono::milliseconds>(timeout).count())
		: -1;
}

inline void
EventLoop::Wait(Event::Duration timeout) noexcept
{
	std::array<struct epoll_event, 32> events;
	const int n = epoll_wait(epoll_fd, events.data(), events.size(),
				 ExportTimeoutMS(timeout));

	for (int i = 0; i < n; ++i) {
		auto &socket_event = *static_cast<SocketEvent *>(events[i].data.ptr);
		socket_event.SetReadyFlags(events[i].events);

		if (!socket_event.is_linked())
			ready_sockets.push_back(socket_event);
	}
}

void
EventLoop::Run() noexcept
{
	assert(IsInside());

	wake_event.Schedule(SocketEvent::READ);

	while (!quit) {
		again = false;
		steady_now.reset();

		/* invoke timers */

		const auto timeout = timers.Run(SteadyNow());
		if (quit)
			break;

		RunDeferred();
		if (quit)
			break;

		{
			std::unique_lock lock{mutex};
			HandleInject(lock);

			if (quit_injected) {
				quit = true;
				break;
			}

			if (again || !defer.empty())
				/* re-evaluate timers because one of
				   the callbacks may have added a new
				   timeout */
				continue;

			busy = false;
		}

		/* wait for new event */

		Wait(timeout);

		{
			const std::scoped_lock lock{mutex};
			busy = true;
		}

		steady_now.reset();

		/* invoke sockets */
		while (!ready_sockets.empty() && !quit) {
			auto &socket_event = ready_sockets.front();
			ready_sockets.pop_front();

			socket_event.Dispatch();
		}
	}

	/* allow calling Run() again, e.g. in unit tests */
	quit = false;

	{
		const std::scoped_lock lock{mutex};
		quit_injected = false;
	}

	wake_event.Cancel();
}

void
EventLoop::OnWake(unsigned) noexcept
{
	uint64_t value;
	[[maybe_unused]] auto nbytes = read(wake_fd, &value, sizeof(value));
}
