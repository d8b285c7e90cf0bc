// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "discovery/Discoverer.hxx"
#include "discovery/Config.hxx"
#include "event/DeferEvent.hxx"
#include "net/IPv4Address.hxx"

#include <boost/intrusive/list.hpp>

#include <cstddef>
#include <vector>

class EventLoop;

/**
 * Probes a list of TCP ports on every host of the local /24
 * networks.  Each host is probed by one #HostProbe which tries the
 * ports one after another and stops at the first open one; the
 * number of simultaneous probes (and thus sockets) is limited.
 */
class PortScanDiscoverer final : public Discoverer {
	class HostProbe;

	EventLoop &event_loop;

	const PortScanConfig config;

	/**
	 * The ports in probing order.
	 */
	std::vector<uint16_t> ports;

	std::vector<IPv4Address> hosts;
	std::size_t next_host = 0;

	boost::intrusive::list<HostProbe,
			       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>>>,
			       boost::intrusive::constant_time_size<true>> probes;

	/**
	 * Reports completion to the listener outside of Start().
	 */
	DeferEvent defer_finished;

	unsigned n_found = 0;

	bool running = false;

public:
	PortScanDiscoverer(EventLoop &_event_loop,
			   const PortScanConfig &_config,
			   DiscoveryListener &_listener) noexcept;
	~PortScanDiscoverer() noexcept override;

	/* virtual methods from class Discoverer */
	DiscoveryMethod GetMethod() const noexcept override {
		return DiscoveryMethod::PORT_SCAN;
	}

	void Start() override;
	void Stop() noexcept override;

	/**
	 * The number of connect attempts in progress (one socket
	 * per host).
	 */
	std::size_t GetConnectionCount() const noexcept {
		return probes.size();
	}

private:
	/**
	 * Start new probes until the socket limit is reached or all
	 * hosts have been probed.
	 */
	void Fill() noexcept;

	void OnProbeDone(HostProbe &probe, uint16_t open_port) noexcept;

	/* callback for #defer_finished */
	void OnDeferredFinished() noexcept;
};
