// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Config.hxx"
#include "portscan/Spectrum.hxx"
#include "config/Data.hxx"
#include "config/Block.hxx"
#include "net/IPv4Address.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringSplit.hxx"

#include <charconv>

#include <string.h>

PortScanConfig::PortScanConfig()
	:ports(ParsePortSpectrum(DEFAULT_PORT_SPECTRUM))
{
}

DiscoveryPreset
ParseDiscoveryPreset(const char *s)
{
	if (strcmp(s, "fast") == 0)
		return DiscoveryPreset::FAST;
	else if (strcmp(s, "comprehensive") == 0)
		return DiscoveryPreset::COMPREHENSIVE;
	else if (strcmp(s, "developer") == 0)
		return DiscoveryPreset::DEVELOPER;
	else
		throw FmtRuntimeError("Unknown preset: \"{}\"", s);
}

void
DiscoveryConfig::ApplyPreset(DiscoveryPreset preset)
{
	switch (preset) {
	case DiscoveryPreset::FAST:
		ssdp.enabled = mdns.enabled = true;
		port_scan.enabled = false;
		timeout = std::chrono::milliseconds(2000);
		break;

	case DiscoveryPreset::COMPREHENSIVE:
		ssdp.enabled = mdns.enabled = port_scan.enabled = true;
		timeout = std::chrono::milliseconds(4000);
		break;

	case DiscoveryPreset::DEVELOPER:
		ssdp.enabled = mdns.enabled = port_scan.enabled = true;
		timeout = std::chrono::milliseconds(8000);
		MergePortSpectrum(port_scan.ports,
				  ParsePortSpectrum(DEVELOPER_PORT_SPECTRUM));
		break;
	}
}

uint32_t
ParseSubnet24(const char *s)
{
	uint32_t result = 0;
	unsigned n = 0;

	ForEachSplit(s, '.', [&](std::string_view octet){
		unsigned value;
		const auto [ptr, ec] = std::from_chars(octet.data(),
						       octet.data() + octet.size(),
						       value);
		if (ec != std::errc{} || ptr != octet.data() + octet.size() ||
		    value > 255 || ++n > 3)
			throw FmtRuntimeError("Malformed subnet: \"{}\"", s);

		result = (result << 8) | value;
	});

	if (n != 3)
		throw FmtRuntimeError("Malformed subnet (a.b.c expected): \"{}\"",
				      s);

	return result;
}

static void
LoadSsdpConfig(SsdpConfig &ssdp, const ConfigBlock &block)
{
	ssdp.enabled = block.GetBlockValue("enabled", ssdp.enabled);
	ssdp.mx = block.GetPositiveValue("mx", ssdp.mx);
	ssdp.search_target = block.GetBlockValue("search_target",
						 ssdp.search_target.c_str());

	if (const auto *param = block.GetBlockParam("address")) {
		if (!IPv4Address::Parse(param->value, 0))
			throw FmtRuntimeError("Malformed IPv4 address \"{}\" on line {}",
					      param->value, param->line);
		ssdp.address = param->value;
	}

	if (const auto *param = block.GetBlockParam("port")) {
		const unsigned port = param->GetPositiveValue();
		if (port > 0xffff)
			throw FmtRuntimeError("Invalid port number on line {}",
					      param->line);
		ssdp.port = port;
	}
	ssdp.fetch_description = block.GetBlockValue("fetch_description",
						      ssdp.fetch_description);
	ssdp.description_timeout = block.GetDuration("description_timeout",
						     ssdp.description_timeout);
}

static void
LoadMdnsConfig(MdnsConfig &mdns, const ConfigBlock &block)
{
	mdns.enabled = block.GetBlockValue("enabled", mdns.enabled);

	if (const auto *param = block.GetBlockParam("service_types")) {
		mdns.service_types.clear();
		ForEachSplit(param->value, ',', [&mdns](std::string_view type){
			mdns.service_types.emplace_back(type);
		});

		if (mdns.service_types.empty())
			throw FmtRuntimeError("No service types on line {}",
					      param->line);
	}
}

static void
LoadPortScanConfig(PortScanConfig &port_scan, const ConfigBlock &block)
{
	port_scan.enabled = block.GetBlockValue("enabled", port_scan.enabled);

	if (const auto *param = block.GetBlockParam("ports"))
		port_scan.ports = param->With([](const char *s){
			return ParsePortSpectrum(s);
		});

	port_scan.connect_timeout = block.GetDuration("connect_timeout",
						      port_scan.connect_timeout);
	port_scan.max_sockets = block.GetPositiveValue("max_sockets",
						       port_scan.max_sockets);

	if (const auto *param = block.GetBlockParam("subnet"))
		port_scan.subnet = param->With(ParseSubnet24);
}

template<typename F>
static void
WithBlock(const ConfigData &config, ConfigBlockOption option, F &&f)
{
	const auto *block = config.GetBlock(option);
	if (block == nullptr)
		return;

	try {
		f(*block);
		block->CheckUnused();
	} catch (...) {
		block->ThrowWithNested();
	}
}

DiscoveryConfig
LoadDiscoveryConfig(const ConfigData &config)
{
	DiscoveryConfig dc;

	if (const auto *param = config.GetParam(ConfigOption::PRESET))
		dc.ApplyPreset(param->With(ParseDiscoveryPreset));

	dc.timeout = config.GetDuration(ConfigOption::DISCOVERY_TIMEOUT,
					dc.timeout);

	const auto &patterns = config.GetParamList(ConfigOption::GENERIC_NAME_PATTERN);
	if (!patterns.empty()) {
		dc.merge.generic_patterns.clear();
		for (const auto &i : patterns)
			dc.merge.generic_patterns.push_back(i.value);
	}

	WithBlock(config, ConfigBlockOption::SSDP, [&dc](const ConfigBlock &block){
		LoadSsdpConfig(dc.ssdp, block);
	});

	WithBlock(config, ConfigBlockOption::MDNS, [&dc](const ConfigBlock &block){
		LoadMdnsConfig(dc.mdns, block);
	});

	WithBlock(config, ConfigBlockOption::PORT_SCAN, [&dc](const ConfigBlock &block){
		LoadPortScanConfig(dc.port_scan, block);
	});

	return dc;
}
