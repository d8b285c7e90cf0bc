// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Description.hxx"
#include "device/Device.hxx"
#include "device/Classify.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"
#include "util/UriExtract.hxx"
#include "Log.hxx"

#include <string.h>

static constexpr std::string_view AVTRANSPORT_SERVICE =
	"urn:schemas-upnp-org:service:AVTransport:";

/**
 * An XML parser which constructs an UPnP device object from the
 * device descriptor.
 */
class UpnpDeviceParser final : public CommonExpatParser {
	UpnpDeviceDescription &description;

	std::vector<std::string> path;

	/**
	 * Character data of the current element.
	 */
	std::string value;

	UpnpService service;

public:
	explicit UpnpDeviceParser(UpnpDeviceDescription &_description) noexcept
		:description(_description) {}

private:
	/**
	 * Is the current element a direct child of the root
	 * device?  (i.e. root/device/X)
	 */
	[[gnu::pure]]
	bool IsRootDeviceProperty() const noexcept {
		return path.size() == 3 && path[1] == "device";
	}

protected:
	/* virtual methods from CommonExpatParser */
	void StartElement(const XML_Char *name, const XML_Char **) override {
		path.emplace_back(name);
		value.clear();
	}

	void EndElement(const XML_Char *name) override {
		const std::string_view s = Strip(std::string_view{value});

		if (strcmp(name, "service") == 0) {
			description.services.emplace_back(std::move(service));
			service = {};
		} else if (strcmp(name, "serviceType") == 0) {
			service.service_type = s;
		} else if (strcmp(name, "controlURL") == 0) {
			service.control_url = s;
		} else if (path.size() == 2 && strcmp(name, "URLBase") == 0) {
			description.url_base = s;
		} else if (IsRootDeviceProperty()) {
			if (strcmp(name, "deviceType") == 0)
				description.device_type = s;
			else if (strcmp(name, "friendlyName") == 0)
				description.friendly_name = s;
			else if (strcmp(name, "manufacturer") == 0)
				description.manufacturer = s;
			else if (strcmp(name, "modelName") == 0)
				description.model_name = s;
			else if (strcmp(name, "UDN") == 0)
				description.udn = s;
		}

		value.clear();
		path.pop_back();
	}

	void CharacterData(const XML_Char *s, int len) override {
		value.append(s, len);
	}
};

/**
 * The "directory" of a URL (everything up to and including the last
 * slash of the path).
 */
[[gnu::pure]]
static std::string_view
UrlDirectory(std::string_view url) noexcept
{
	const auto path = uri_get_path(url);
	if (path.data() == nullptr || path.empty())
		return url;

	const auto slash = path.rfind('/');
	return url.substr(0, (path.data() - url.data()) + slash + 1);
}

void
UpnpDeviceDescription::Parse(std::string_view location, std::string_view xml)
{
	{
		UpnpDeviceParser parser(*this);
		parser.Parse(xml, true);
	}

	if (url_base.empty())
		/* no URLBase: relative URLs are relative to the
		   document location */
		url_base = UrlDirectory(location);
}

const UpnpService *
UpnpDeviceDescription::FindService(std::string_view type_prefix) const noexcept
{
	for (const auto &i : services)
		if (std::string_view{i.service_type}.starts_with(type_prefix))
			return &i;

	return nullptr;
}

[[gnu::pure]]
static uint16_t
GetEffectivePort(std::string_view uri) noexcept
{
	if (const auto port = uri_get_port(uri); port != 0)
		return port;

	return StringEqualsCaseASCII(uri_get_scheme(uri), "https") ? 443 : 80;
}

/**
 * Do both URLs point to the same HTTP server?
 */
[[gnu::pure]]
static bool
IsSameServer(std::string_view a, std::string_view b) noexcept
{
	return StringEqualsCaseASCII(uri_get_host(a), uri_get_host(b)) &&
		GetEffectivePort(a) == GetEffectivePort(b);
}

std::string
ResolveControlPath(std::string_view url_base,
		   std::string_view control_url) noexcept
{
	if (control_url.empty())
		return Device::DEFAULT_CONTROL_URL;

	if (!uri_get_scheme(control_url).empty()) {
		/* absolute URL */
		if (!IsSameServer(url_base, control_url))
			/* the service lives on another server; the
			   control client uses absolute URLs as-is */
			return std::string{control_url};

		const auto path = uri_get_path(control_url);
		if (path.empty())
			return "/";

		return std::string{path};
	}

	if (control_url.front() == '/')
		return std::string{control_url};

	/* relative to the URLBase path */
	auto base_path = uri_get_path(url_base);
	if (base_path.empty())
		base_path = "/";

	std::string result{base_path.substr(0, base_path.rfind('/') + 1)};
	if (result.empty())
		result = "/";

	result.append(control_url);
	return result;
}

Device
ApplyDescription(const Device &provisional,
		 const UpnpDeviceDescription &description) noexcept
{
	Device device = provisional;
	device.method = DiscoveryMethod::SSDP;

	if (!description.friendly_name.empty())
		device.friendly_name = description.friendly_name;
	if (!description.manufacturer.empty())
		device.manufacturer = description.manufacturer;
	if (!description.model_name.empty())
		device.model_name = description.model_name;
	if (!description.device_type.empty())
		device.device_type = description.device_type;

	if (!description.udn.empty()) {
		std::string_view udn = description.udn;
		if (udn.starts_with("uuid:"))
			udn.remove_prefix(5);
		device.uuid = udn;
	}

	if (const auto *service = description.FindService(AVTRANSPORT_SERVICE))
		device.control_url = ResolveControlPath(description.url_base,
							service->control_url);

	/* classify by what the device says about itself */
	const KindHint &hint = *ClassifySsdp(description.manufacturer,
					     description.device_type,
					     description.model_name);
	device.classification = KnownClass{hint.kind};

	if (!description.device_type.empty())
		device.SetMetadata("xml.deviceType", description.device_type);
	if (!description.model_name.empty())
		device.SetMetadata("xml.modelName", description.model_name);
	if (!description.udn.empty())
		device.SetMetadata("xml.udn", description.udn);

	return device;
}
