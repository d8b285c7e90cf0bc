// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>
#include <string_view>
#include <vector>

struct Device;

/**
 * A service announced in the UPnP device description.
 */
struct UpnpService {
	std::string service_type;
	std::string control_url;
};

/**
 * The subset of a UPnP device description document we are
 * interested in.
 */
struct UpnpDeviceDescription {
	std::string device_type;
	std::string friendly_name;
	std::string manufacturer;
	std::string model_name;
	std::string udn;
	std::string url_base;

	/**
	 * Services of the root device and all embedded devices.
	 */
	std::vector<UpnpService> services;

	/**
	 * Parse the description document.
	 *
	 * Throws #ExpatError on malformed XML.
	 *
	 * @param location the URL the document was downloaded from;
	 * it is used as URLBase if the document has none
	 */
	void Parse(std::string_view location, std::string_view xml);

	/**
	 * Find the first service whose type starts with the given
	 * prefix (e.g. "urn:schemas-upnp-org:service:AVTransport:").
	 */
	[[gnu::pure]]
	const UpnpService *FindService(std::string_view type_prefix) const noexcept;
};

/**
 * Convert a control URL from the description document to a path
 * on the device.  Absolute URLs pointing to the URLBase server are
 * reduced to their path, absolute URLs on other servers are kept, and
 * relative ones are resolved against URLBase.
 */
[[gnu::pure]]
std::string
ResolveControlPath(std::string_view url_base,
		   std::string_view control_url) noexcept;

/**
 * Build the updated record of a device from its description.
 *
 * @param provisional the record built from the SSDP response
 */
Device
ApplyDescription(const Device &provisional,
		 const UpnpDeviceDescription &description) noexcept;

