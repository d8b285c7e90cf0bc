// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <memory>

class EventLoop;
class CurlGlobal;

/**
 * This class performs initialization of libcurl and owns the
 * #CurlGlobal instance shared by all requests on one #EventLoop.
 */
class CurlInit {
	std::unique_ptr<CurlGlobal> instance;

public:
	/**
	 * Throws on error.
	 */
	explicit CurlInit(EventLoop &event_loop);
	~CurlInit() noexcept;

	CurlInit(const CurlInit &) = delete;
	CurlInit &operator=(const CurlInit &) = delete;

	CurlGlobal &operator*() noexcept {
		return *instance;
	}

	CurlGlobal *operator->() noexcept {
		return instance.get();
	}
};
