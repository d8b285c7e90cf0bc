// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "SocketDescriptor.hxx"

#include <utility>

/**
 * Wrapper for a socket file descriptor which closes it in the
 * destructor.
 */
class UniqueSocketDescriptor : public SocketDescriptor {
public:
	UniqueSocketDescriptor() noexcept
		:SocketDescriptor(SocketDescriptor::Undefined()) {}

	explicit UniqueSocketDescriptor(SocketDescriptor _fd) noexcept
		:SocketDescriptor(_fd) {}

	UniqueSocketDescriptor(UniqueSocketDescriptor &&other) noexcept
		:SocketDescriptor(std::exchange((SocketDescriptor &)other,
						Undefined())) {}

	~UniqueSocketDescriptor() noexcept {
		Close();
	}

	UniqueSocketDescriptor &operator=(UniqueSocketDescriptor &&src) noexcept {
		using std::swap;
		swap(static_cast<SocketDescriptor &>(*this),
		     static_cast<SocketDescriptor &>(src));
		return *this;
	}

	SocketDescriptor Release() noexcept {
		return std::exchange(static_cast<SocketDescriptor &>(*this),
				     Undefined());
	}
};
