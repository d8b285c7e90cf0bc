// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Soap.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <cstdlib>

static void
AppendXmlEscaped(std::string &dest, std::string_view src) noexcept
{
	for (const char ch : src) {
		switch (ch) {
		case '&':
			dest.append("&amp;");
			break;

		case '<':
			dest.append("&lt;");
			break;

		case '>':
			dest.append("&gt;");
			break;

		case '"':
			dest.append("&quot;");
			break;

		case '\'':
			dest.append("&apos;");
			break;

		default:
			dest.push_back(ch);
		}
	}
}

std::string
BuildSoapEnvelope(std::string_view action,
		  std::span<const SoapArgument> arguments) noexcept
{
	std::string result =
		"<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\""
		" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
		"<s:Body>";

	result.append(fmt::format("<u:{} xmlns:u=\"{}\">",
				  action, AVTRANSPORT_SERVICE_TYPE));

	for (const auto &i : arguments) {
		result.push_back('<');
		result.append(i.name);
		result.push_back('>');
		AppendXmlEscaped(result, i.value);
		result.append("</");
		result.append(i.name);
		result.push_back('>');
	}

	result.append(fmt::format("</u:{}>", action));
	result.append("</s:Body></s:Envelope>");
	return result;
}

std::string
BuildSoapActionHeader(std::string_view action) noexcept
{
	return fmt::format("\"{}#{}\"", AVTRANSPORT_SERVICE_TYPE, action);
}

std::string
SoapFault::ToString() const noexcept
{
	if (error_code != 0) {
		if (error_description.empty())
			return fmt::format("UPnPError {}", error_code);

		return fmt::format("UPnPError {}: {}",
				   error_code, error_description);
	}

	if (!fault_string.empty())
		return fault_string;

	if (!fault_code.empty())
		return fault_code;

	return "Unspecified SOAP fault";
}

SoapFaultError::SoapFaultError(SoapFault &&_fault) noexcept
	:std::runtime_error(fmt::format("SOAP fault: {}", _fault.ToString())),
	 fault(std::move(_fault))
{
}

/**
 * Strip the namespace (or prefix) from an element name.
 */
[[gnu::pure]]
static std::string_view
LocalName(std::string_view name) noexcept
{
	const auto i = name.find_last_of("|:");
	if (i != std::string_view::npos)
		name = name.substr(i + 1);
	return name;
}

namespace {

/**
 * Collects the first Body child and its descendants.  The depth
 * counts from the Envelope (1).
 */
class SoapResponseParser final : public CommonExpatParser {
	SoapResponse &response;

	unsigned depth = 0;

	bool envelope = false, body = false;

	/**
	 * Are we inside the first element of the Body?
	 */
	bool inside = false, done = false;

	std::string value;

public:
	explicit SoapResponseParser(SoapResponse &_response) noexcept
		:CommonExpatParser(ExpatNamespaceSeparator{'|'}),
		 response(_response) {}

	void Check() const {
		if (!envelope)
			throw std::runtime_error("Not a SOAP envelope");

		if (!body || response.element.empty())
			throw std::runtime_error("Empty SOAP body");
	}

protected:
	void StartElement(const XML_Char *_name, const XML_Char **) override {
		const auto name = LocalName(_name);
		++depth;
		value.clear();

		if (depth == 1) {
			envelope = name == "Envelope";
		} else if (depth == 2) {
			if (name == "Body")
				body = true;
		} else if (depth == 3 && body && !done) {
			response.element = name;
			inside = true;
		}
	}

	void EndElement(const XML_Char *_name) override {
		const auto name = LocalName(_name);

		if (inside) {
			if (depth == 3) {
				inside = false;
				done = true;
			} else if (response.IsFault()) {
				/* the UPnPError detail is nested deeper;
				   only the element name matters */
				const auto s = Strip(std::string_view{value});
				if (name == "faultcode")
					response.fault.fault_code = s;
				else if (name == "faultstring")
					response.fault.fault_string = s;
				else if (name == "errorCode")
					response.fault.error_code =
						std::strtoul(std::string{s}.c_str(),
							     nullptr, 10);
				else if (name == "errorDescription")
					response.fault.error_description = s;
			} else if (depth == 4) {
				response.arguments.insert_or_assign(std::string{name},
								    std::string{value});
			}
		}

		value.clear();
		--depth;
	}

	void CharacterData(const XML_Char *s, int len) override {
		if (inside)
			value.append(s, len);
	}
};

} // anonymous namespace

SoapResponse
ParseSoapResponse(std::string_view xml)
{
	SoapResponse response;

	SoapResponseParser parser(response);
	parser.Parse(xml, true);
	parser.Check();

	return response;
}
