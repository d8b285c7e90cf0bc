// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SignalMonitor.hxx"

#include <cerrno>
#include <system_error>

#include <sys/signalfd.h>
#include <unistd.h>

SignalMonitor::SignalMonitor(EventLoop &_loop, Callback _callback) noexcept
	:event(_loop, BIND_THIS_METHOD(OnSocketReady)),
	 callback(_callback)
{
	sigemptyset(&mask);
}

SignalMonitor::~SignalMonitor() noexcept
{
	event.Close();
	sigprocmask(SIG_UNBLOCK, &mask, nullptr);
}

void
SignalMonitor::Register(int signo)
{
	sigaddset(&mask, signo);

	if (sigprocmask(SIG_BLOCK, &mask, nullptr) < 0)
		throw std::system_error(errno, std::system_category(),
					"sigprocmask() failed");

	const int old_fd = event.IsDefined() ? event.GetSocket().Get() : -1;
	const int fd = signalfd(old_fd, &mask, SFD_NONBLOCK|SFD_CLOEXEC);
	if (fd < 0)
		throw std::system_error(errno, std::system_category(),
					"signalfd() failed");

	if (old_fd < 0) {
		event.Open(SocketDescriptor(fd));
		event.ScheduleRead();
	}
}

void
SignalMonitor::OnSocketReady(unsigned) noexcept
{
	signalfd_siginfo info;
	while (read(event.GetSocket().Get(), &info, sizeof(info)) == sizeof(info))
		callback(info.ssi_signo);
}
