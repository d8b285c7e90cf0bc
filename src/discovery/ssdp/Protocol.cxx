// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Protocol.hxx"
#include "device/Device.hxx"
#include "device/Classify.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"
#include "util/UriExtract.hxx"

#include <fmt/format.h>

#include <arpa/inet.h>

std::string
BuildSsdpSearch(std::string_view search_target, unsigned mx) noexcept
{
	return fmt::format("M-SEARCH * HTTP/1.1\r\n"
			   "HOST: {}:{}\r\n"
			   "MAN: \"ssdp:discover\"\r\n"
			   "ST: {}\r\n"
			   "MX: {}\r\n"
			   "\r\n",
			   SSDP_MULTICAST_ADDRESS, SSDP_PORT,
			   search_target, mx);
}

/**
 * Extract the next line (without the line terminator) and advance
 * the input.
 */
static std::string_view
NextLine(std::string_view &input) noexcept
{
	auto eol = input.find('\n');
	std::string_view line;
	if (eol == std::string_view::npos) {
		line = input;
		input = {};
	} else {
		line = input.substr(0, eol);
		input = input.substr(eol + 1);
	}

	if (!line.empty() && line.back() == '\r')
		line.remove_suffix(1);

	return line;
}

/**
 * Is this the status line of a successful response, e.g.
 * "HTTP/1.1 200 OK"?
 */
[[gnu::pure]]
static bool
IsOkStatusLine(std::string_view line) noexcept
{
	if (!StringStartsWithCaseASCII(line, "HTTP/1."))
		return false;

	line.remove_prefix(7);
	if (line.empty() || !IsDigitASCII(line.front()))
		return false;

	line.remove_prefix(1);
	line = StripLeft(line);

	return line.substr(0, 3) == "200" &&
		(line.size() == 3 || !IsDigitASCII(line[3]));
}

std::optional<SsdpResponse>
ParseSsdpResponse(std::string_view datagram) noexcept
{
	if (!IsOkStatusLine(NextLine(datagram)))
		return std::nullopt;

	SsdpResponse response;

	while (datagram.data() != nullptr && !datagram.empty()) {
		const auto line = NextLine(datagram);
		if (line.empty())
			/* end of headers */
			break;

		const auto colon = line.find(':');
		if (colon == std::string_view::npos)
			continue;

		const auto name = Strip(line.substr(0, colon));
		const auto value = Strip(line.substr(colon + 1));

		if (StringEqualsCaseASCII(name, "location"))
			response.location = value;
		else if (StringEqualsCaseASCII(name, "server"))
			response.server = value;
		else if (StringEqualsCaseASCII(name, "st"))
			response.st = value;
		else if (StringEqualsCaseASCII(name, "usn"))
			response.usn = value;
	}

	return response;
}

[[gnu::pure]]
static bool
IsNumericIPv4(std::string_view host) noexcept
{
	if (host.empty() || host.size() >= INET_ADDRSTRLEN)
		return false;

	char buffer[INET_ADDRSTRLEN];
	host.copy(buffer, host.size());
	buffer[host.size()] = 0;

	struct in_addr addr;
	return inet_pton(AF_INET, buffer, &addr) == 1;
}

/**
 * Extract a UUID from a USN header
 * ("uuid:RINCON_xxx::upnp:rootdevice").
 */
[[gnu::pure]]
static std::string_view
UuidFromUsn(std::string_view usn) noexcept
{
	if (!StringStartsWithCaseASCII(usn, "uuid:"))
		return {};

	usn.remove_prefix(5);
	return usn.substr(0, usn.find("::"));
}

Device
MakeSsdpDevice(const SsdpResponse &response,
	       std::string_view sender_ip) noexcept
{
	const KindHint &hint = *ClassifySsdp(response.server, response.usn,
					     response.location);

	const auto location_host = uri_get_host(response.location);
	const auto ip = IsNumericIPv4(location_host)
		? location_host
		: sender_ip;

	uint16_t port = uri_get_port(response.location);
	if (port == 0) {
		/* no explicit port in LOCATION: guess from the
		   device kind */
		if (std::string_view{hint.kind} == "Sonos")
			port = 1400;
		else if (std::string_view{hint.kind} == "Chromecast")
			port = 8008;
		else if (StringEqualsCaseASCII(uri_get_scheme(response.location),
					       "https"))
			port = 443;
		else
			port = 80;
	}

	Device device(ip, port, DiscoveryMethod::SSDP);
	device.friendly_name = MakeGenericName(hint.base_name, ip);
	device.device_type = response.st;
	device.control_url = hint.control_url;
	device.uuid = UuidFromUsn(response.usn);

	device.manufacturer = hint.manufacturer != nullptr
		? std::string{hint.manufacturer}
		: ManufacturerFromServer(response.server);

	if (IsGenericSsdpHint(hint))
		device.classification = UnknownClass{};
	else
		device.classification = HeuristicClass{hint.kind, "SSDP headers"};

	if (!response.server.empty())
		device.SetMetadata("ssdp.server", response.server);
	if (!response.st.empty())
		device.SetMetadata("ssdp.st", response.st);
	if (!response.usn.empty())
		device.SetMetadata("ssdp.usn", response.usn);
	if (!response.location.empty())
		device.SetMetadata("xml.location", response.location);

	return device;
}
