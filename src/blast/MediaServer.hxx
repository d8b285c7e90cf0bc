// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "event/DeferEvent.hxx"

#include <exception>
#include <string>
#include <utility>

class MediaServerHandler {
public:
	/**
	 * The server is ready.
	 *
	 * @param url the URL of the clip; may be empty if the server
	 * has nothing to serve
	 */
	virtual void OnMediaServerReady(std::string url) noexcept = 0;

	virtual void OnMediaServerError(std::exception_ptr error) noexcept = 0;
};

/**
 * The component which serves the media clip to the renderers.
 */
class MediaServer {
public:
	virtual ~MediaServer() noexcept = default;

	/**
	 * Start serving.  The handler is invoked asynchronously,
	 * never from inside this method.
	 */
	virtual void Start(MediaServerHandler &handler) noexcept = 0;

	/**
	 * Stop serving (and cancel a pending Start()).
	 */
	virtual void Stop() noexcept = 0;
};

/**
 * A #MediaServer which is not under our control: the clip is served
 * by somebody else at a known URL.
 */
class ExternalMediaServer final : public MediaServer {
	const std::string url;

	DeferEvent defer_ready;

	MediaServerHandler *handler = nullptr;

public:
	ExternalMediaServer(EventLoop &event_loop, std::string _url) noexcept
		:url(std::move(_url)),
		 defer_ready(event_loop, BIND_THIS_METHOD(OnDeferredReady)) {}

	void Start(MediaServerHandler &_handler) noexcept override {
		handler = &_handler;
		defer_ready.Schedule();
	}

	void Stop() noexcept override {
		defer_ready.Cancel();
		handler = nullptr;
	}

private:
	void OnDeferredReady() noexcept {
		auto &h = *handler;
		handler = nullptr;
		h.OnMediaServerReady(url);
	}
};
