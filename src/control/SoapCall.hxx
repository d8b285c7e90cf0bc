// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Soap.hxx"
#include "lib/curl/Request.hxx"
#include "lib/curl/Slist.hxx"
#include "lib/curl/StringHandler.hxx"

#include <chrono>
#include <exception>
#include <span>
#include <string>

class CurlGlobal;

class SoapCallHandler {
public:
	/**
	 * The action has succeeded.  The method may destroy the
	 * #SoapCall.
	 */
	virtual void OnSoapResponse(SoapResponse &&response) noexcept = 0;

	/**
	 * The action has failed: network error, timeout, HTTP error
	 * or SOAP fault (#SoapFaultError).  The method may destroy
	 * the #SoapCall.
	 */
	virtual void OnSoapError(std::exception_ptr error) noexcept = 0;
};

/**
 * One SOAP action POSTed to a control URL.
 */
class SoapCall final : StringCurlResponseHandler {
	SoapCallHandler &handler;

	CurlSlist request_headers;

	CurlRequest request;

public:
	/**
	 * Throws on error.
	 *
	 * @param timeout the maximum duration of the whole request
	 */
	SoapCall(CurlGlobal &curl, const char *url,
		 std::string_view action,
		 std::span<const SoapArgument> arguments,
		 std::chrono::milliseconds timeout,
		 SoapCallHandler &_handler);

	SoapCall(const SoapCall &) = delete;
	SoapCall &operator=(const SoapCall &) = delete;

	/**
	 * Throws on error.
	 */
	void Start() {
		request.Start();
	}

private:
	/* virtual methods from class StringCurlResponseHandler */
	void OnStringResponse(StringCurlResponse &&response) override;

	/* virtual methods from class CurlResponseHandler */
	void OnError(std::exception_ptr e) noexcept override {
		handler.OnSoapError(std::move(e));
	}
};

/**
 * Build the absolute URL for a device path.
 */
std::string
MakeDeviceUrl(std::string_view ip, uint16_t port,
	      std::string_view path) noexcept;
