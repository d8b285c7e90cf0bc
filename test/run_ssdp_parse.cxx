// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Parses an SSDP search response (or, with a LOCATION argument, a
 * UPnP device description) from stdin and prints the resulting
 * device record.
 */

#include "discovery/ssdp/Protocol.hxx"
#include "discovery/ssdp/Description.hxx"
#include "device/Device.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <iostream>
#include <iterator>
#include <string>

#include <stdlib.h>

static void
PrintDevice(const Device &device)
{
	fmt::print("address: {}:{}\n", device.ip_address, device.port);
	fmt::print("name: {:?}\n", device.friendly_name);
	fmt::print("manufacturer: {:?}\n", device.manufacturer);
	fmt::print("model: {:?}\n", device.model_name);
	fmt::print("type: {}\n", device.device_type);
	fmt::print("control: {}\n", device.control_url);
	fmt::print("kind: {}\n", GetKind(device.classification));

	for (const auto &[key, value] : device.metadata)
		fmt::print("  {}={:?}\n", key, value);
}

int
main(int argc, char **argv)
try {
	if (argc > 3) {
		fmt::print(stderr, "Usage: run_ssdp_parse [SENDER_IP [LOCATION]] <INPUT\n");
		return EXIT_FAILURE;
	}

	const char *const sender_ip = argc >= 2 ? argv[1] : "127.0.0.1";

	const std::string input{std::istreambuf_iterator<char>(std::cin),
				std::istreambuf_iterator<char>()};

	if (argc == 3) {
		const char *const location = argv[2];

		UpnpDeviceDescription description;
		description.Parse(location, input);

		for (const auto &i : description.services)
			fmt::print("service: {} {}\n",
				   i.service_type, i.control_url);

		SsdpResponse response;
		response.location = location;
		PrintDevice(ApplyDescription(MakeSsdpDevice(response, sender_ip),
					     description));
		return EXIT_SUCCESS;
	}

	const auto response = ParseSsdpResponse(input);
	if (!response) {
		fmt::print(stderr, "Not an SSDP response\n");
		return EXIT_FAILURE;
	}

	fmt::print("location: {}\nserver: {}\nst: {}\nusn: {}\n",
		   response->location, response->server,
		   response->st, response->usn);
	PrintDevice(MakeSsdpDevice(*response, sender_ip));
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
