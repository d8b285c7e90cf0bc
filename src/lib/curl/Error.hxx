// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <curl/curl.h>

#include <stdexcept>

/**
 * An error reported by libcurl.
 */
class CurlError : public std::runtime_error {
	CURLcode code;

public:
	CurlError(CURLcode _code, const char *msg) noexcept
		:std::runtime_error(msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}

	/**
	 * Was this a timeout (connect or transfer)?
	 */
	bool IsTimeout() const noexcept {
		return code == CURLE_OPERATION_TIMEDOUT;
	}
};

/**
 * The HTTP server responded with an unexpected status.
 */
class HttpStatusError : public std::runtime_error {
	unsigned status;

public:
	HttpStatusError(unsigned _status, const char *msg) noexcept
		:std::runtime_error(msg), status(_status) {}

	unsigned GetStatus() const noexcept {
		return status;
	}
};
