// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Record.hxx"
#include "device/Device.hxx"
#include "device/Classify.hxx"
#include "util/ASCII.hxx"
#include "util/StringSplit.hxx"

#include <fmt/format.h>

namespace {

/**
 * Properties of a known DNS-SD service type.
 */
struct MdnsServiceKind {
	const char *service_type;
	const char *kind;
	const char *manufacturer;
	const char *control_url;

	/**
	 * Used when the SRV record was not resolved.
	 */
	uint16_t default_port;
};

constexpr MdnsServiceKind mdns_service_kinds[] = {
	{ "_googlecast._tcp", "Chromecast", "Google", ControlUrl::CAST, 8009 },
	{ "_airplay._tcp", "AirPlay", "Apple", "/airplay", 7000 },
	{ "_raop._tcp", "RAOP", "Apple", "/raop", 7000 },
	{ "_dlna._tcp", "DLNA renderer", nullptr, ControlUrl::SONOS, 80 },
};

} // anonymous namespace

[[gnu::pure]]
static const MdnsServiceKind *
FindServiceKind(std::string_view service_type) noexcept
{
	for (const auto &i : mdns_service_kinds)
		if (StringEqualsCaseASCII(service_type, i.service_type))
			return &i;

	return nullptr;
}

const std::string *
MdnsServiceRecord::GetTxt(std::string_view key) const noexcept
{
	for (const auto &[name, value] : txt)
		if (StringEqualsCaseASCII(name, key))
			return &value;

	return nullptr;
}

void
MdnsServiceRecord::AddTxt(std::string_view s) noexcept
{
	if (s.empty())
		return;

	const auto [key, value] = Split(s, '=');
	if (key.empty())
		return;

	txt.emplace_back(key, value.data() != nullptr
			 ? std::string{value}
			 : std::string{});
}

/**
 * Return the TXT value if it exists and is not empty.
 */
[[gnu::pure]]
static const std::string *
GetNonEmptyTxt(const MdnsServiceRecord &record, std::string_view key) noexcept
{
	const auto *value = record.GetTxt(key);
	return value != nullptr && !value->empty() ? value : nullptr;
}

std::optional<Device>
MakeMdnsDevice(const MdnsServiceRecord &record) noexcept
{
	if (record.address.empty())
		return std::nullopt;

	const auto *kind = FindServiceKind(record.service_type);

	uint16_t port = record.port;
	if (port == 0 && kind != nullptr)
		port = kind->default_port;

	Device device(record.address, port, DiscoveryMethod::MDNS);
	device.device_type = record.service_type;

	const std::string *name = nullptr;
	const std::string *model = nullptr;

	if (kind == nullptr) {
		/* an unknown service type: keep what we have */
		device.classification = UnknownClass{};
	} else {
		device.control_url = kind->control_url;
		if (kind->manufacturer != nullptr)
			device.manufacturer = kind->manufacturer;
		device.classification = KnownClass{kind->kind};

		if (kind == &mdns_service_kinds[0]) {
			/* Chromecast */
			name = GetNonEmptyTxt(record, "fn");
			model = GetNonEmptyTxt(record, "md");
			if (const auto *id = GetNonEmptyTxt(record, "id"))
				device.uuid = *id;
		} else if (kind == &mdns_service_kinds[1] ||
			   kind == &mdns_service_kinds[2]) {
			/* AirPlay / RAOP */
			name = GetNonEmptyTxt(record, "cn");
			model = GetNonEmptyTxt(record, "am");
		} else {
			model = GetNonEmptyTxt(record, "model");
		}
	}

	if (name != nullptr)
		device.friendly_name = *name;
	else if (!record.instance_name.empty())
		device.friendly_name = record.instance_name;
	else
		device.friendly_name = MakeGenericName(kind != nullptr
						       ? kind->kind
						       : "Device",
						       record.address);

	if (model != nullptr)
		device.model_name = *model;

	device.SetMetadata("mdns.service", record.service_type);
	if (!record.host_name.empty())
		device.SetMetadata("mdns.host", record.host_name);

	for (const auto &[key, value] : record.txt)
		device.SetMetadata(fmt::format("mdns.{}", key), value);

	return device;
}
