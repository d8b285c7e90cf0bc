// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Easy.hxx"
#include "Headers.hxx"

#include <cstddef>
#include <exception>
#include <string_view>

class CurlGlobal;
class CurlResponseHandler;

/**
 * A non-blocking HTTP request integrated via #CurlGlobal into the
 * #EventLoop.
 *
 * To start sending the request, call Start().  Destroying the object
 * cancels the request.
 */
class CurlRequest final {
	CurlGlobal &global;

	CurlResponseHandler &handler;

	/**
	 * The CURL easy handle.
	 */
	CurlEasy easy;

	enum class State {
		HEADERS,
		BODY,
		CLOSED,
	} state = State::HEADERS;

	/**
	 * Response headers collected so far; the names are converted
	 * to lower case.
	 */
	Curl::Headers headers;

	/**
	 * An exception caught from within a libcurl callback.  It is
	 * passed to the handler when the request finishes.
	 */
	std::exception_ptr postponed_error;

	/**
	 * Is the #CURL* registered with #CurlGlobal?
	 */
	bool registered = false;

	/**
	 * Error message provided by libcurl.
	 */
	char error_buffer[CURL_ERROR_SIZE];

public:
	/**
	 * To start sending the request, call Start().
	 */
	CurlRequest(CurlGlobal &_global, CurlEasy &&_easy,
		    CurlResponseHandler &_handler);

	CurlRequest(CurlGlobal &_global, const char *url,
		    CurlResponseHandler &_handler)
		:CurlRequest(_global, CurlEasy{url}, _handler) {}

	~CurlRequest() noexcept;

	CurlRequest(const CurlRequest &) = delete;
	CurlRequest &operator=(const CurlRequest &) = delete;

	/**
	 * Register this request via CurlGlobal::Add(), which starts
	 * the request.
	 *
	 * This method must be called in the event loop thread.
	 */
	void Start();

	/**
	 * Unregister this request via CurlGlobal::Remove().
	 *
	 * This method must be called in the event loop thread.
	 */
	void Stop() noexcept;

	CURL *Get() noexcept {
		return easy.Get();
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		easy.SetOption(option, value);
	}

	/**
	 * CurlGlobal calls this when the transfer has finished.
	 */
	void Done(CURLcode result) noexcept;

private:
	void SetupEasy();

	void FinishHeaders();
	void FinishBody();

	std::size_t DataReceived(const void *ptr, std::size_t size) noexcept;

	void HeaderFunction(std::string_view s) noexcept;

	/** libcurl callback function */
	static std::size_t _HeaderFunction(char *ptr, std::size_t size,
					   std::size_t nmemb,
					   void *stream) noexcept;

	/** libcurl callback function */
	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *stream) noexcept;
};
