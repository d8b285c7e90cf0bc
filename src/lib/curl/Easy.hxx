// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libcurl "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws std::runtime_error on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::runtime_error("curl_easy_init() failed");
	}

	explicit CurlEasy(const char *url)
		:CurlEasy()
	{
		SetURL(url);
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw CurlError(code, curl_easy_strerror(code));
	}

	template<typename T>
	bool TrySetOption(CURLoption option, T value) noexcept {
		return curl_easy_setopt(handle, option, value) == CURLE_OK;
	}

	void SetPrivate(void *pointer) {
		SetOption(CURLOPT_PRIVATE, pointer);
	}

	void SetErrorBuffer(char *buf) {
		SetOption(CURLOPT_ERRORBUFFER, buf);
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetUserAgent(const char *value) {
		SetOption(CURLOPT_USERAGENT, value);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	void SetNoProgress(bool value=true) {
		SetOption(CURLOPT_NOPROGRESS, (long)value);
	}

	void SetNoSignal(bool value=true) {
		SetOption(CURLOPT_NOSIGNAL, (long)value);
	}

	void SetFollowLocation(bool value=true) {
		SetOption(CURLOPT_FOLLOWLOCATION, (long)value);
	}

	void SetMaxRedirects(long value) {
		SetOption(CURLOPT_MAXREDIRS, value);
	}

	/**
	 * Limit the whole transfer (connect, request, response).
	 */
	void SetTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_TIMEOUT_MS, (long)timeout.count());
	}

	void SetConnectTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS, (long)timeout.count());
	}

	void SetHeaderFunction(std::size_t (*function)(char *buffer, std::size_t size,
							 std::size_t nitems,
							 void *userdata) noexcept,
			       void *userdata) {
		SetOption(CURLOPT_HEADERFUNCTION, function);
		SetOption(CURLOPT_HEADERDATA, userdata);
	}

	void SetWriteFunction(std::size_t (*function)(char *ptr, std::size_t size,
							std::size_t nmemb,
							void *userdata) noexcept,
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	/**
	 * Send a POST request with the given body.  The buffer is
	 * copied by libcurl.
	 */
	void SetRequestBody(const void *data, std::size_t size) {
		SetOption(CURLOPT_POSTFIELDSIZE, (long)size);
		SetOption(CURLOPT_COPYPOSTFIELDS, data);
	}

	template<typename T>
	bool GetInfo(CURLINFO info, T value_r) const noexcept {
		return ::curl_easy_getinfo(handle, info, value_r) == CURLE_OK;
	}

	/**
	 * Returns the response code or 0 if no response was received.
	 */
	long GetResponseCode() const noexcept {
		long value;
		return GetInfo(CURLINFO_RESPONSE_CODE, &value)
			? value
			: 0;
	}
};
