// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Handler.hxx"

#include <string>

struct StringCurlResponse {
	unsigned status;
	Curl::Headers headers;
	std::string body;
};

/**
 * A #CurlResponseHandler implementation which collects the response
 * body in a std::string.
 */
class StringCurlResponseHandler : public CurlResponseHandler {
	StringCurlResponse response;

	/**
	 * Larger response bodies are rejected.
	 */
	const std::size_t max_size;

public:
	explicit StringCurlResponseHandler(std::size_t _max_size=256 * 1024) noexcept
		:max_size(_max_size) {}

protected:
	/**
	 * The whole response has been received.  This method is
	 * allowed to delete the #CurlRequest.
	 */
	virtual void OnStringResponse(StringCurlResponse &&_response) = 0;

public:
	/* virtual methods from class CurlResponseHandler */
	void OnHeaders(unsigned status, Curl::Headers &&headers) override;
	void OnData(std::span<const std::byte> data) override;
	void OnEnd() override;
};
