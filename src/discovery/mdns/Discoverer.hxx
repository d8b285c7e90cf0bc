// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "discovery/Discoverer.hxx"
#include "discovery/Config.hxx"

#ifdef HAVE_AVAHI
#include "lib/avahi/ConnectionListener.hxx"
#include "device/Device.hxx"

#include <avahi-client/lookup.h>

#include <memory>
#include <set>
#include <vector>

namespace Avahi { class Client; }
#endif

class EventLoop;

/**
 * Browses DNS-SD service types with the Avahi daemon and resolves the
 * instances.  Without Avahi support, Start() always fails.
 */
class MdnsDiscoverer final
	: public Discoverer
#ifdef HAVE_AVAHI
	, Avahi::ConnectionListener
#endif
{
	EventLoop &event_loop;

	const MdnsConfig config;

#ifdef HAVE_AVAHI
	struct BrowserDeleter {
		void operator()(AvahiServiceBrowser *b) const noexcept {
			avahi_service_browser_free(b);
		}
	};

	std::unique_ptr<Avahi::Client> client;

	std::vector<std::unique_ptr<AvahiServiceBrowser, BrowserDeleter>> browsers;

	/**
	 * Resolvers which have not yet invoked their callback.
	 */
	std::set<AvahiServiceResolver *> resolvers;

	std::set<DeviceKey> seen;
#endif

public:
	MdnsDiscoverer(EventLoop &_event_loop, const MdnsConfig &_config,
		       DiscoveryListener &_listener) noexcept;
	~MdnsDiscoverer() noexcept override;

	/* virtual methods from class Discoverer */
	DiscoveryMethod GetMethod() const noexcept override {
		return DiscoveryMethod::MDNS;
	}

	void Start() override;
	void Stop() noexcept override;

#ifdef HAVE_AVAHI
private:
	void CancelLookups() noexcept;

	void OnBrowse(AvahiIfIndex interface, AvahiProtocol protocol,
		      AvahiBrowserEvent event,
		      const char *name, const char *type,
		      const char *domain) noexcept;
	static void BrowseCallback(AvahiServiceBrowser *b,
				   AvahiIfIndex interface,
				   AvahiProtocol protocol,
				   AvahiBrowserEvent event,
				   const char *name, const char *type,
				   const char *domain,
				   AvahiLookupResultFlags flags,
				   void *userdata) noexcept;

	/**
	 * Start resolving a service instance.
	 *
	 * @param with_txt false to resolve only SRV and address
	 * records (for devices which do not answer the TXT query)
	 */
	void StartResolver(AvahiIfIndex interface, AvahiProtocol protocol,
			   const char *name, const char *type,
			   const char *domain, bool with_txt) noexcept;

	void OnResolve(AvahiIfIndex interface, AvahiProtocol protocol,
		       AvahiResolverEvent event,
		       const char *name, const char *type,
		       const char *domain,
		       const char *host_name,
		       const AvahiAddress *address, uint16_t port,
		       AvahiStringList *txt, bool with_txt) noexcept;

	template<bool with_txt>
	static void ResolveCallback(AvahiServiceResolver *r,
				    AvahiIfIndex interface,
				    AvahiProtocol protocol,
				    AvahiResolverEvent event,
				    const char *name, const char *type,
				    const char *domain,
				    const char *host_name,
				    const AvahiAddress *address,
				    uint16_t port, AvahiStringList *txt,
				    AvahiLookupResultFlags flags,
				    void *userdata) noexcept;

	/* virtual methods from class Avahi::ConnectionListener */
	void OnAvahiConnect(AvahiClient *c) noexcept override;
	void OnAvahiDisconnect() noexcept override;
	void OnAvahiError(std::exception_ptr e) noexcept override;
#endif
};
