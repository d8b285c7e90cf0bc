// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Discoverer.hxx"
#include "Protocol.hxx"
#include "Description.hxx"
#include "discovery/Listener.hxx"
#include "lib/curl/Request.hxx"
#include "lib/curl/StringHandler.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "net/IPv4Address.hxx"
#include "net/SocketError.hxx"
#include "net/ToString.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <cstddef>
#include <span>

static constexpr Domain ssdp_domain("ssdp");

static constexpr Event::Duration SSDP_RESEND_DELAY = std::chrono::milliseconds(500);
static constexpr unsigned SSDP_N_SEARCHES = 2;

/**
 * Downloads and parses the description document of one device.
 */
class SsdpDiscoverer::DescriptionFetch final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>,
	  StringCurlResponseHandler
{
	SsdpDiscoverer &parent;

	const Device provisional;

	CurlRequest request;

public:
	DescriptionFetch(SsdpDiscoverer &_parent, CurlGlobal &curl,
			 const Device &_provisional, const std::string &location,
			 std::chrono::milliseconds timeout)
		:StringCurlResponseHandler(64 * 1024),
		 parent(_parent), provisional(_provisional),
		 request(curl, location.c_str(), *this)
	{
		request.SetOption(CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
		request.SetOption(CURLOPT_FOLLOWLOCATION, 1L);
		request.SetOption(CURLOPT_MAXREDIRS, 3L);
	}

	void Start() {
		request.Start();
	}

	const Device &GetProvisional() const noexcept {
		return provisional;
	}

private:
	/* virtual methods from class StringCurlResponseHandler */
	void OnStringResponse(StringCurlResponse &&response) override {
		if (response.status != 200)
			throw HttpStatusError(response.status,
					      "Unexpected HTTP status");

		const auto *location = provisional.GetMetadata("xml.location");

		UpnpDeviceDescription description;
		description.Parse(location != nullptr ? *location : std::string{},
				  response.body);

		parent.OnFetchSuccess(*this,
				      ApplyDescription(provisional, description));
	}

	/* virtual methods from class CurlResponseHandler */
	void OnError(std::exception_ptr e) noexcept override {
		parent.OnFetchError(*this, std::move(e));
	}
};

SsdpDiscoverer::SsdpDiscoverer(EventLoop &event_loop, CurlGlobal &_curl,
			       const SsdpConfig &_config,
			       DiscoveryListener &_listener) noexcept
	:Discoverer(_listener),
	 config(_config), curl(_curl),
	 socket_event(event_loop, BIND_THIS_METHOD(OnSocketReady)),
	 resend_timer(event_loop, BIND_THIS_METHOD(OnResendTimer))
{
}

SsdpDiscoverer::~SsdpDiscoverer() noexcept
{
	Stop();

	fetches.clear_and_dispose([](DescriptionFetch *f){
		delete f;
	});
}

void
SsdpDiscoverer::SendSearch()
{
	const auto request = BuildSsdpSearch(config.search_target, config.mx);
	const auto destination = IPv4Address::Parse(config.address, config.port);
	if (!destination)
		throw FmtRuntimeError("Malformed SSDP address {:?}",
				      config.address);

	++n_searches;

	if (socket_event.GetSocket().WriteTo(std::as_bytes(std::span{request}),
					     *destination) < 0)
		throw MakeSocketError("Failed to send M-SEARCH");
}

void
SsdpDiscoverer::Start()
{
	UniqueSocketDescriptor fd;
	if (!fd.CreateNonBlock(AF_INET, SOCK_DGRAM, 0))
		throw MakeSocketError("Failed to create SSDP socket");

	if (!fd.Bind(IPv4Address(uint16_t(0))))
		throw MakeSocketError("Failed to bind SSDP socket");

	/* the responses are unicast to our port; joining the
	   multicast group is not necessary for M-SEARCH */
	if (!fd.SetMulticastTtl(2))
		LogWarning(ssdp_domain, "Failed to set the multicast TTL");

	socket_event.Open(fd.Release());
	socket_event.ScheduleRead();

	try {
		n_searches = 0;
		SendSearch();
	} catch (...) {
		socket_event.Close();
		throw;
	}

	resend_timer.Schedule(SSDP_RESEND_DELAY);

	FmtDebug(ssdp_domain, "Searching for {:?}", config.search_target);
}

void
SsdpDiscoverer::Stop() noexcept
{
	resend_timer.Cancel();
	socket_event.Close();
}

void
SsdpDiscoverer::StartFetch(const Device &device) noexcept
{
	const auto *location = device.GetMetadata("xml.location");
	if (location == nullptr)
		return;

	try {
		auto *fetch = new DescriptionFetch(*this, curl, device, *location,
						   config.description_timeout);
		fetches.push_back(*fetch);

		try {
			fetch->Start();
		} catch (...) {
			delete fetch;
			throw;
		}
	} catch (...) {
		FmtWarning(ssdp_domain, "Failed to fetch {:?}: {}",
			   *location, std::current_exception());
		return;
	}

	++fetches_in_flight;
	listener.OnDescriptionProgress(fetches_in_flight, fetches_completed);
}

void
SsdpDiscoverer::OnFetchSuccess(DescriptionFetch &fetch, Device &&device) noexcept
{
	delete &fetch;

	--fetches_in_flight;
	++fetches_completed;

	FmtDebug(ssdp_domain, "Description of {}: {:?} control={:?}",
		 ToString(device.GetKey()), device.friendly_name,
		 device.control_url);

	listener.OnDescriptionProgress(fetches_in_flight, fetches_completed);
	listener.OnDeviceUpdate(std::move(device));
}

void
SsdpDiscoverer::OnFetchError(DescriptionFetch &fetch,
			     std::exception_ptr error) noexcept
{
	/* the device stays discovered with its heuristic defaults */
	FmtDebug(ssdp_domain, "Description of {} failed: {}",
		 ToString(fetch.GetProvisional().GetKey()), error);

	delete &fetch;

	--fetches_in_flight;
	++fetches_completed;

	listener.OnDescriptionProgress(fetches_in_flight, fetches_completed);
}

inline void
SsdpDiscoverer::OnDatagram(std::string_view payload,
			   const IPv4Address &sender) noexcept
{
	const auto response = ParseSsdpResponse(payload);
	if (!response) {
		FmtDebug(ssdp_domain, "Ignoring malformed response from {}",
			 ToString(sender));
		return;
	}

	Device device = MakeSsdpDevice(*response, HostToString(sender));
	if (!seen.emplace(device.GetKey()).second)
		/* duplicate (devices answer once per search type) */
		return;

	FmtDebug(ssdp_domain, "Found {} ({:?})",
		 ToString(device.GetKey()), response->server);

	listener.OnDeviceFound(Device{device});

	if (config.fetch_description && !response->location.empty())
		StartFetch(device);
}

void
SsdpDiscoverer::OnSocketReady(unsigned) noexcept
{
	std::byte buffer[4096];

	while (true) {
		IPv4Address sender;
		const auto nbytes = socket_event.GetSocket().ReadFrom(buffer,
								      sender);
		if (nbytes < 0) {
			const auto e = GetSocketError();
			if (!IsSocketErrorReceiveWouldBlock(e))
				FmtWarning(ssdp_domain, "{}",
					   std::make_exception_ptr(MakeSocketError(e, "Failed to receive SSDP response")));
			break;
		}

		OnDatagram({reinterpret_cast<const char *>(buffer),
			    std::size_t(nbytes)},
			   sender);

		if (!socket_event.IsDefined())
			/* stopped by the listener */
			break;
	}
}

void
SsdpDiscoverer::OnResendTimer() noexcept
{
	try {
		SendSearch();
	} catch (...) {
		FmtWarning(ssdp_domain, "{}", std::current_exception());
	}

	if (n_searches < SSDP_N_SEARCHES)
		resend_timer.Schedule(SSDP_RESEND_DELAY);
}
