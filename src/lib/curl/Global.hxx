// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "event/FineTimerEvent.hxx"
#include "event/DeferEvent.hxx"

#include <curl/curl.h>

class EventLoop;
class CurlSocket;
class CurlRequest;

/**
 * Manager for the global CURLM object, which multiplexes all
 * #CurlRequest instances on the #EventLoop.
 */
class CurlGlobal final {
	CURLM *const multi;

	DeferEvent defer_read_info;

	FineTimerEvent timeout_event;

public:
	explicit CurlGlobal(EventLoop &_loop);
	~CurlGlobal() noexcept;

	CurlGlobal(const CurlGlobal &) = delete;
	CurlGlobal &operator=(const CurlGlobal &) = delete;

	auto &GetEventLoop() const noexcept {
		return timeout_event.GetEventLoop();
	}

	/**
	 * Throws CurlError on error.
	 */
	void Add(CurlRequest &r);

	void Remove(CurlRequest &r) noexcept;

	/**
	 * Check for finished HTTP responses.
	 */
	void ReadInfo() noexcept;

	void Assign(curl_socket_t fd, CurlSocket &cs) noexcept {
		curl_multi_assign(multi, fd, &cs);
	}

	void SocketAction(curl_socket_t fd, int ev_bitmask) noexcept;

	void InvalidateSockets() noexcept {
		SocketAction(CURL_SOCKET_TIMEOUT, 0);
	}

private:
	void UpdateTimeout(long timeout_ms) noexcept;
	static int TimerFunction(CURLM *multi, long timeout_ms,
				 void *userp) noexcept;

	/* callback for #timeout_event */
	void OnTimeout() noexcept;
};
