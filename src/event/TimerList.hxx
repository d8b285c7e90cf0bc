// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Chrono.hxx"
#include "FineTimerEvent.hxx"

#include <boost/intrusive/set.hpp>

/**
 * A list of #FineTimerEvent instances sorted by due time point.
 */
class TimerList final {
	struct Compare {
		constexpr bool operator()(const FineTimerEvent &a,
					  const FineTimerEvent &b) const noexcept {
			return a.due < b.due;
		}
	};

	boost::intrusive::multiset<FineTimerEvent,
				   boost::intrusive::base_hook<boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
				   boost::intrusive::compare<Compare>,
				   boost::intrusive::constant_time_size<false>> timers;

public:
	TimerList() = default;
	~TimerList() noexcept;

	TimerList(const TimerList &other) = delete;
	TimerList &operator=(const TimerList &other) = delete;

	bool IsEmpty() const noexcept {
		return timers.empty();
	}

	void Insert(FineTimerEvent &t) noexcept {
		timers.insert(t);
	}

	/**
	 * Invoke all expired #FineTimerEvent instances and return the
	 * duration until the next timer expires.  Returns a negative
	 * duration if there is no timeout.
	 */
	Event::Duration Run(Event::TimePoint now) noexcept;
};
