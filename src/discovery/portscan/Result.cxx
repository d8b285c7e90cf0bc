// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Result.hxx"
#include "device/Device.hxx"
#include "device/Classify.hxx"

#include <fmt/format.h>

#include <algorithm>

Device
MakePortScanDevice(std::string_view ip, uint16_t port) noexcept
{
	Device device(ip, port, DiscoveryMethod::PORT_SCAN);
	device.SetMetadata("port_scan.port", fmt::format("{}", port));

	if (const auto *hint = ClassifyPort(port)) {
		device.friendly_name = MakeGenericName(hint->base_name, ip);
		device.control_url = hint->control_url;
		if (hint->manufacturer != nullptr)
			device.manufacturer = hint->manufacturer;
		device.classification =
			HeuristicClass{hint->kind, fmt::format("port {}", port)};
		device.SetMetadata("port_scan.kind", hint->kind);
	} else {
		device.friendly_name = MakeGenericName("Device", ip, port);
		device.classification = UnknownClass{};
	}

	return device;
}

void
PrioritizeKnownPorts(std::vector<uint16_t> &ports) noexcept
{
	std::stable_partition(ports.begin(), ports.end(), [](uint16_t port){
		return ClassifyPort(port) != nullptr;
	});
}
