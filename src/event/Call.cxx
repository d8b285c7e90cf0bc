// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Call.hxx"
#include "Loop.hxx"
#include "InjectEvent.hxx"

#include <condition_variable>
#include <exception>
#include <mutex>

class BlockingCallMonitor final
{
	InjectEvent event;

	const std::function<void()> f;

	std::mutex mutex;
	std::condition_variable cond;

	bool done = false;
	std::exception_ptr error;

public:
	BlockingCallMonitor(EventLoop &_loop,
			    std::function<void()> &&_f) noexcept
		:event(_loop, BIND_THIS_METHOD(RunDeferred)),
		 f(std::move(_f)) {}

	void Run() {
		event.Schedule();

		std::unique_lock lock{mutex};
		cond.wait(lock, [this]{ return done; });

		if (error)
			std::rethrow_exception(error);
	}

private:
	void RunDeferred() noexcept {
		std::exception_ptr e;

		try {
			f();
		} catch (...) {
			e = std::current_exception();
		}

		const std::scoped_lock lock{mutex};
		error = std::move(e);
		done = true;
		cond.notify_one();
	}
};

void
BlockingCall(EventLoop &loop, std::function<void()> &&f)
{
	if (!loop.IsAlive() || loop.IsInside()) {
		/* we're already inside the loop - we can simply call
		   the function */
		f();
	} else {
		/* outside the EventLoop's thread - defer execution to
		   the EventLoop, wait for completion */
		BlockingCallMonitor m(loop, std::move(f));
		m.Run();
	}
}
