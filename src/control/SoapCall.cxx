// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SoapCall.hxx"
#include "lib/curl/Error.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/ASCII.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

static constexpr Domain soap_domain("soap");

SoapCall::SoapCall(CurlGlobal &curl, const char *url,
		   std::string_view action,
		   std::span<const SoapArgument> arguments,
		   std::chrono::milliseconds timeout,
		   SoapCallHandler &_handler)
	:StringCurlResponseHandler(64 * 1024),
	 handler(_handler),
	 request(curl, url, *this)
{
	request_headers.Append("Content-Type: text/xml; charset=\"utf-8\"");
	request_headers.Append(fmt::format("SOAPACTION: {}",
					   BuildSoapActionHeader(action)).c_str());
	/* some renderers choke on "Expect: 100-continue" */
	request_headers.Append("Expect:");

	const auto body = BuildSoapEnvelope(action, arguments);

	request.SetOption(CURLOPT_HTTPHEADER, request_headers.Get());
	request.SetOption(CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
	request.SetOption(CURLOPT_COPYPOSTFIELDS, body.c_str());
	request.SetOption(CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
}

void
SoapCall::OnStringResponse(StringCurlResponse &&response)
{
	/* faults are usually delivered with status 500, but some
	   devices use 200 */
	if (response.status == 200 || response.status == 500) {
		SoapResponse soap;

		try {
			soap = ParseSoapResponse(response.body);
		} catch (...) {
			if (response.status == 200) {
				/* the status says the action succeeded;
				   many renderers send an empty or
				   sloppy body with it */
				FmtDebug(soap_domain,
					 "Ignoring malformed SOAP response body: {}",
					 std::current_exception());
				handler.OnSoapResponse(SoapResponse{});
				return;
			}

			throw HttpStatusError(response.status,
					      "SOAP request failed with status 500");
		}

		if (soap.IsFault())
			throw SoapFaultError(std::move(soap.fault));

		if (response.status != 200)
			throw HttpStatusError(response.status,
					      "SOAP request failed with status 500");

		handler.OnSoapResponse(std::move(soap));
		return;
	}

	throw HttpStatusError(response.status,
			      fmt::format("SOAP request failed with status {}",
					  response.status).c_str());
}

std::string
MakeDeviceUrl(std::string_view ip, uint16_t port,
	      std::string_view path) noexcept
{
	if (StringStartsWithCaseASCII(path, "http://") ||
	    StringStartsWithCaseASCII(path, "https://"))
		return std::string{path};

	if (path.empty() || path.front() != '/')
		return fmt::format("http://{}:{}/{}", ip, port, path);

	return fmt::format("http://{}:{}{}", ip, port, path);
}
