// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

static constexpr const char *AVTRANSPORT_SERVICE_TYPE =
	"urn:schemas-upnp-org:service:AVTransport:1";

struct SoapArgument {
	const char *name;
	std::string_view value;
};

/**
 * Build a SOAP 1.1 request envelope for an action of the
 * AVTransport:1 service.  Argument values are XML-escaped.
 */
std::string
BuildSoapEnvelope(std::string_view action,
		  std::span<const SoapArgument> arguments) noexcept;

/**
 * Build the value of the "SOAPACTION" request header (including the
 * double quotes).
 */
std::string
BuildSoapActionHeader(std::string_view action) noexcept;

/**
 * The contents of a SOAP fault.
 */
struct SoapFault {
	std::string fault_code;
	std::string fault_string;

	/**
	 * From the UPnPError detail; 0 if there is none.
	 */
	unsigned error_code = 0;

	std::string error_description;

	/**
	 * Format for humans, e.g. "UPnPError 716: Resource not
	 * found".
	 */
	[[gnu::pure]]
	std::string ToString() const noexcept;
};

/**
 * The device has responded with a SOAP fault.
 */
class SoapFaultError final : public std::runtime_error {
	SoapFault fault;

public:
	explicit SoapFaultError(SoapFault &&_fault) noexcept;

	const SoapFault &GetFault() const noexcept {
		return fault;
	}
};

/**
 * A parsed SOAP response envelope.
 */
struct SoapResponse {
	/**
	 * The local name of the first element in the Body,
	 * e.g. "PlayResponse" or "Fault".
	 */
	std::string element;

	/**
	 * The output arguments (child elements of the response
	 * element) by local name.
	 */
	std::map<std::string, std::string, std::less<>> arguments;

	/**
	 * Only valid if IsFault().
	 */
	SoapFault fault;

	bool IsFault() const noexcept {
		return element == "Fault";
	}

	[[gnu::pure]]
	const std::string *GetArgument(std::string_view name) const noexcept {
		auto i = arguments.find(name);
		return i != arguments.end() ? &i->second : nullptr;
	}
};

/**
 * Parse a SOAP response envelope.
 *
 * Throws #ExpatError on malformed XML and std::runtime_error if the
 * document is not a SOAP envelope.
 */
SoapResponse
ParseSoapResponse(std::string_view xml);
