// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "DeferEvent.hxx"
#include "Loop.hxx"

void
DeferEvent::Schedule() noexcept
{
	if (!IsPending())
		loop.AddDefer(*this);
}
