// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "State.hxx"

const char *
ToString(BlastState state) noexcept
{
	switch (state) {
	case BlastState::IDLE:
		return "idle";

	case BlastState::SERVING:
		return "serving";

	case BlastState::DISCOVERING:
		return "discovering";

	case BlastState::CONTROLLING:
		return "controlling";

	case BlastState::SUMMARIZING:
		return "summarizing";

	case BlastState::DONE:
		return "done";
	}

	return "?";
}
