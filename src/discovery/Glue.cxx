// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Glue.hxx"
#include "ssdp/Discoverer.hxx"
#include "mdns/Discoverer.hxx"
#include "portscan/Discoverer.hxx"

std::vector<std::unique_ptr<Discoverer>>
DefaultDiscovererFactory::CreateDiscoverers(DiscoveryListener &listener)
{
	std::vector<std::unique_ptr<Discoverer>> result;

	if (config.ssdp.enabled)
		result.emplace_back(std::make_unique<SsdpDiscoverer>(event_loop,
								     curl,
								     config.ssdp,
								     listener));

	if (config.mdns.enabled)
		result.emplace_back(std::make_unique<MdnsDiscoverer>(event_loop,
								     config.mdns,
								     listener));

	if (config.port_scan.enabled)
		result.emplace_back(std::make_unique<PortScanDiscoverer>(event_loop,
									 config.port_scan,
									 listener));

	return result;
}
