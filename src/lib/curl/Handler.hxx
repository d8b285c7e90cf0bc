// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Headers.hxx"

#include <cstddef>
#include <exception>
#include <span>

/**
 * Asynchronous response handler for a #CurlRequest.
 *
 * All methods are invoked in the #EventLoop thread.
 */
class CurlResponseHandler {
public:
	/**
	 * Status line and headers have been received.
	 *
	 * Exceptions thrown by this method will be passed to
	 * OnError(), aborting the request.
	 */
	virtual void OnHeaders(unsigned status, Curl::Headers &&headers) = 0;

	/**
	 * Response body data has been received.
	 *
	 * Exceptions thrown by this method will be passed to
	 * OnError(), aborting the request.
	 */
	virtual void OnData(std::span<const std::byte> data) = 0;

	/**
	 * The response has ended.  The method is allowed to delete
	 * the #CurlRequest here.
	 */
	virtual void OnEnd() = 0;

	/**
	 * An error has occurred.  The method is allowed to delete the
	 * #CurlRequest here.
	 */
	virtual void OnError(std::exception_ptr e) noexcept = 0;
};
