// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Classify.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

static constexpr KindHint ssdp_sonos{
	"Sonos", "Sonos Speaker", "Sonos", ControlUrl::SONOS,
};

static constexpr KindHint ssdp_chromecast{
	"Chromecast", "Chromecast", "Google", ControlUrl::UPNP,
};

static constexpr KindHint ssdp_roku{
	"Roku", "Roku Device", "Roku", ControlUrl::UPNP,
};

static constexpr KindHint ssdp_dlna{
	"DLNA renderer", "DLNA Device", nullptr, ControlUrl::UPNP,
};

static constexpr KindHint ssdp_generic{
	"UPnP", "UPnP Device", nullptr, ControlUrl::UPNP,
};

[[gnu::pure]]
static bool
AnyContains(std::string_view a, std::string_view b, std::string_view c,
	    std::string_view needle) noexcept
{
	return StringContainsCaseASCII(a, needle) ||
		StringContainsCaseASCII(b, needle) ||
		StringContainsCaseASCII(c, needle);
}

const KindHint *
ClassifySsdp(std::string_view server, std::string_view usn,
	     std::string_view location) noexcept
{
	if (AnyContains(server, usn, location, "sonos"))
		return &ssdp_sonos;

	if (AnyContains(server, usn, location, "chromecast") ||
	    AnyContains(server, usn, location, "cast"))
		return &ssdp_chromecast;

	if (AnyContains(server, usn, location, "roku"))
		return &ssdp_roku;

	if (AnyContains(server, usn, location, "dlna") ||
	    AnyContains(server, usn, location, "mediarenderer"))
		return &ssdp_dlna;

	return &ssdp_generic;
}

bool
IsGenericSsdpHint(const KindHint &hint) noexcept
{
	return &hint == &ssdp_generic;
}

std::string
ManufacturerFromServer(std::string_view server) noexcept
{
	server = Strip(server);
	if (server.empty())
		return {};

	if (StringContainsCaseASCII(server, "sonos"))
		return "Sonos";

	if (StringContainsCaseASCII(server, "google") ||
	    StringContainsCaseASCII(server, "cast"))
		return "Google";

	/* "Linux/3.14 UPnP/1.0 Vendor/1.0": use the first product
	   token */
	auto product = server.substr(0, server.find('/'));
	return std::string{Strip(product)};
}

struct PortRange {
	uint16_t first, last;
	KindHint hint;
};

static constexpr PortRange port_table[] = {
	{ 1400, 1410, { "Sonos", "Sonos Speaker", "Sonos", ControlUrl::SONOS } },
	{ 7000, 7000, { "AirPlay", "Apple AirPlay", "Apple", "/AVTransport/control" } },
	{ 7100, 7100, { "AirPlay", "Apple AirPlay", "Apple", "/AVTransport/control" } },
	{ 8008, 8009, { "Chromecast", "Chromecast", "Google", ControlUrl::CAST } },
	{ 8200, 8205, { "Samsung", "Samsung TV", "Samsung", ControlUrl::UPNP } },
	{ 49152, 49170, { "UPnP", "UPnP Device", nullptr, ControlUrl::UPNP } },
};

const KindHint *
ClassifyPort(uint16_t port) noexcept
{
	for (const auto &i : port_table)
		if (port >= i.first && port <= i.last)
			return &i.hint;

	return nullptr;
}

std::string
MakeGenericName(const char *base_name, std::string_view ip) noexcept
{
	return fmt::format("{} at {}", base_name, ip);
}

std::string
MakeGenericName(const char *base_name, std::string_view ip,
		uint16_t port) noexcept
{
	return fmt::format("{} at {}:{}", base_name, ip, port);
}
