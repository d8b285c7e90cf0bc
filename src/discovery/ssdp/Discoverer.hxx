// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "discovery/Discoverer.hxx"
#include "discovery/Config.hxx"
#include "device/Device.hxx"
#include "event/SocketEvent.hxx"
#include "event/FineTimerEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <set>

class CurlGlobal;

/**
 * Finds UPnP devices with SSDP M-SEARCH requests and downloads their
 * description documents.
 */
class SsdpDiscoverer final : public Discoverer {
	class DescriptionFetch;

	const SsdpConfig config;

	CurlGlobal &curl;

	SocketEvent socket_event;

	/**
	 * Repeats the M-SEARCH request; UDP is lossy.
	 */
	FineTimerEvent resend_timer;

	/**
	 * Provisional identities of all devices reported so far.
	 */
	std::set<DeviceKey> seen;

	boost::intrusive::list<DescriptionFetch,
			       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
			       boost::intrusive::constant_time_size<false>> fetches;

	unsigned n_searches = 0;

	unsigned fetches_in_flight = 0, fetches_completed = 0;

public:
	SsdpDiscoverer(EventLoop &event_loop, CurlGlobal &_curl,
		       const SsdpConfig &_config,
		       DiscoveryListener &_listener) noexcept;
	~SsdpDiscoverer() noexcept override;

	/* virtual methods from class Discoverer */
	DiscoveryMethod GetMethod() const noexcept override {
		return DiscoveryMethod::SSDP;
	}

	void Start() override;
	void Stop() noexcept override;

private:
	/**
	 * Throws on error.
	 */
	void SendSearch();

	void StartFetch(const Device &device) noexcept;

	void OnFetchSuccess(DescriptionFetch &fetch, Device &&device) noexcept;
	void OnFetchError(DescriptionFetch &fetch,
			  std::exception_ptr error) noexcept;

	void OnDatagram(std::string_view payload,
			const IPv4Address &sender) noexcept;

	/* callback for #socket_event */
	void OnSocketReady(unsigned events) noexcept;

	/* callback for #resend_timer */
	void OnResendTimer() noexcept;
};
