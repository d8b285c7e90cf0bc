// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Device.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/format.h>

#include <charconv>

const char *
ToString(DiscoveryMethod method) noexcept
{
	switch (method) {
	case DiscoveryMethod::SSDP:
		return "SSDP";

	case DiscoveryMethod::MDNS:
		return "mDNS";

	case DiscoveryMethod::PORT_SCAN:
		return "PortScan";
	}

	return "?";
}

const char *
ToString(DeviceStatus status) noexcept
{
	switch (status) {
	case DeviceStatus::DISCOVERED:
		return "discovered";

	case DeviceStatus::CONNECTING:
		return "connecting";

	case DeviceStatus::SUCCESS:
		return "success";

	case DeviceStatus::FAILED:
		return "failed";
	}

	return "?";
}

std::string_view
GetKind(const DeviceClass &c) noexcept
{
	if (const auto *h = std::get_if<HeuristicClass>(&c))
		return h->kind;

	if (const auto *k = std::get_if<KnownClass>(&c))
		return k->kind;

	return {};
}

std::string
ToString(const DeviceKey &key) noexcept
{
	return fmt::format("{}:{}", key.ip, key.port);
}

DeviceKey
ParseDeviceKey(std::string_view s)
{
	const auto colon = s.rfind(':');
	if (colon == std::string_view::npos || colon == 0)
		throw FmtRuntimeError("Malformed device address (IP:PORT expected): \"{}\"",
				      s);

	const auto port_string = s.substr(colon + 1);
	unsigned port;
	const auto [ptr, ec] = std::from_chars(port_string.data(),
					       port_string.data() + port_string.size(),
					       port);
	if (ec != std::errc{} || ptr != port_string.data() + port_string.size() ||
	    port == 0 || port > 0xffff)
		throw FmtRuntimeError("Malformed port number: \"{}\"", port_string);

	return {std::string{s.substr(0, colon)}, uint16_t(port)};
}

std::string
Device::GetDisplayName() const noexcept
{
	if (friendly_name.empty())
		return ToString(GetKey());

	return fmt::format("{} ({}:{})", friendly_name, ip_address, port);
}
