// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Discoverer.hxx"
#include "discovery/Listener.hxx"

#ifdef HAVE_AVAHI
#include "Record.hxx"
#include "lib/avahi/Client.hxx"
#include "lib/avahi/Error.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/strlst.h>

static constexpr Domain mdns_domain("mdns");
#else
#include <stdexcept>
#endif

MdnsDiscoverer::MdnsDiscoverer(EventLoop &_event_loop,
			       const MdnsConfig &_config,
			       DiscoveryListener &_listener) noexcept
	:Discoverer(_listener), event_loop(_event_loop), config(_config)
{
}

MdnsDiscoverer::~MdnsDiscoverer() noexcept
{
	Stop();
}

#ifdef HAVE_AVAHI

void
MdnsDiscoverer::Start()
{
	seen.clear();

	/* may invoke OnAvahiConnect() before it returns */
	client = std::make_unique<Avahi::Client>(event_loop,
						 static_cast<Avahi::ConnectionListener &>(*this));
}

void
MdnsDiscoverer::CancelLookups() noexcept
{
	for (auto *r : resolvers)
		avahi_service_resolver_free(r);
	resolvers.clear();

	browsers.clear();
}

void
MdnsDiscoverer::Stop() noexcept
{
	CancelLookups();
	client.reset();
}

void
MdnsDiscoverer::StartResolver(AvahiIfIndex interface, AvahiProtocol protocol,
			      const char *name, const char *type,
			      const char *domain, bool with_txt) noexcept
{
	auto *r = avahi_service_resolver_new(client->GetClient(),
					     interface, protocol,
					     name, type, domain,
					     AVAHI_PROTO_INET,
					     with_txt
					     ? AvahiLookupFlags(0)
					     : AVAHI_LOOKUP_NO_TXT,
					     with_txt
					     ? ResolveCallback<true>
					     : ResolveCallback<false>,
					     this);
	if (r == nullptr) {
		FmtWarning(mdns_domain, "Failed to resolve {:?}: {}", name,
			   avahi_strerror(avahi_client_errno(client->GetClient())));
		return;
	}

	resolvers.emplace(r);
}

inline void
MdnsDiscoverer::OnResolve(AvahiIfIndex interface, AvahiProtocol protocol,
			  AvahiResolverEvent event,
			  const char *name, const char *type,
			  const char *domain,
			  const char *host_name,
			  const AvahiAddress *address, uint16_t port,
			  AvahiStringList *txt, bool with_txt) noexcept
{
	if (event != AVAHI_RESOLVER_FOUND) {
		if (with_txt) {
			/* Avahi fails the whole lookup if one record
			   is missing; the TXT record is the one many
			   devices omit, so try again without it and
			   report what the SRV and address records
			   say */
			FmtDebug(mdns_domain,
				 "Failed to resolve {:?} ({}), retrying without TXT",
				 name, type);
			StartResolver(interface, protocol, name, type, domain,
				      false);
		} else
			FmtDebug(mdns_domain, "Failed to resolve {:?} ({})",
				 name, type);
		return;
	}

	MdnsServiceRecord record;
	record.service_type = type;
	record.instance_name = name;
	if (host_name != nullptr)
		record.host_name = host_name;
	record.port = port;

	if (address != nullptr && address->proto == AVAHI_PROTO_INET) {
		char buffer[AVAHI_ADDRESS_STR_MAX];
		avahi_address_snprint(buffer, sizeof(buffer), address);
		record.address = buffer;
	}

	for (auto *i = txt; i != nullptr; i = avahi_string_list_get_next(i))
		record.AddTxt({reinterpret_cast<const char *>(avahi_string_list_get_text(i)),
			       avahi_string_list_get_size(i)});

	auto device = MakeMdnsDevice(record);
	if (!device) {
		FmtDebug(mdns_domain, "No IPv4 address for {:?} ({})",
			 name, type);
		return;
	}

	if (!seen.emplace(device->GetKey()).second)
		return;

	FmtDebug(mdns_domain, "Found {:?} at {} ({})",
		 device->friendly_name, ToString(device->GetKey()), type);

	listener.OnDeviceFound(std::move(*device));
}

template<bool with_txt>
void
MdnsDiscoverer::ResolveCallback(AvahiServiceResolver *r,
				AvahiIfIndex interface,
				AvahiProtocol protocol,
				AvahiResolverEvent event,
				const char *name, const char *type,
				const char *domain,
				const char *host_name,
				const AvahiAddress *address,
				uint16_t port, AvahiStringList *txt,
				AvahiLookupResultFlags,
				void *userdata) noexcept
{
	auto &d = *static_cast<MdnsDiscoverer *>(userdata);

	d.resolvers.erase(r);

	d.OnResolve(interface, protocol, event, name, type, domain,
		    host_name, address, port, txt, with_txt);

	/* the strings passed to OnResolve() belong to the
	   resolver */
	avahi_service_resolver_free(r);
}

inline void
MdnsDiscoverer::OnBrowse(AvahiIfIndex interface, AvahiProtocol protocol,
			 AvahiBrowserEvent event,
			 const char *name, const char *type,
			 const char *domain) noexcept
{
	switch (event) {
	case AVAHI_BROWSER_NEW:
		StartResolver(interface, protocol, name, type, domain, true);
		break;

	case AVAHI_BROWSER_FAILURE:
		FmtWarning(mdns_domain, "Failed to browse {}: {}", type,
			   avahi_strerror(avahi_client_errno(client->GetClient())));
		break;

	case AVAHI_BROWSER_REMOVE:
	case AVAHI_BROWSER_ALL_FOR_NOW:
	case AVAHI_BROWSER_CACHE_EXHAUSTED:
		break;
	}
}

void
MdnsDiscoverer::BrowseCallback(AvahiServiceBrowser *,
			       AvahiIfIndex interface,
			       AvahiProtocol protocol,
			       AvahiBrowserEvent event,
			       const char *name, const char *type,
			       const char *domain,
			       AvahiLookupResultFlags,
			       void *userdata) noexcept
{
	auto &d = *static_cast<MdnsDiscoverer *>(userdata);
	d.OnBrowse(interface, protocol, event, name, type, domain);
}

void
MdnsDiscoverer::OnAvahiConnect(AvahiClient *c) noexcept
{
	for (const auto &type : config.service_types) {
		auto *b = avahi_service_browser_new(c, AVAHI_IF_UNSPEC,
						    AVAHI_PROTO_INET,
						    type.c_str(), nullptr,
						    AvahiLookupFlags(0),
						    BrowseCallback, this);
		if (b == nullptr) {
			FmtWarning(mdns_domain, "Failed to browse {}: {}",
				   type, avahi_strerror(avahi_client_errno(c)));
			continue;
		}

		browsers.emplace_back(b);
	}

	FmtDebug(mdns_domain, "Browsing {} service types", browsers.size());
}

void
MdnsDiscoverer::OnAvahiDisconnect() noexcept
{
	CancelLookups();
}

void
MdnsDiscoverer::OnAvahiError(std::exception_ptr e) noexcept
{
	CancelLookups();

	if (client == nullptr)
		/* inside Start(); the Avahi::Client constructor will
		   throw */
		return;

	listener.OnDiscovererError(DiscoveryMethod::MDNS, std::move(e));
}

#else

void
MdnsDiscoverer::Start()
{
	(void)event_loop;
	throw std::runtime_error("mDNS support (Avahi) was not compiled in");
}

void
MdnsDiscoverer::Stop() noexcept
{
}

#endif
