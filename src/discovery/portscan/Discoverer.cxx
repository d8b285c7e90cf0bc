// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Discoverer.hxx"
#include "Result.hxx"
#include "discovery/Listener.hxx"
#include "device/Device.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "event/SocketEvent.hxx"
#include "event/FineTimerEvent.hxx"
#include "net/LocalNetwork.hxx"
#include "net/SocketError.hxx"
#include "net/ToString.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <algorithm>
#include <stdexcept>

#include <sys/socket.h>

static constexpr Domain port_scan_domain("port_scan");

/**
 * Probes the ports of one host.
 */
class PortScanDiscoverer::HostProbe final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>>
{
	PortScanDiscoverer &parent;

	const IPv4Address host;

	SocketEvent socket_event;

	FineTimerEvent timeout_event;

	/**
	 * Moves on to the next port after a connect() which failed
	 * immediately, so the parent is never called back from
	 * inside Start().
	 */
	DeferEvent defer_next;

	std::size_t port_index = 0;

	/**
	 * Creating a socket has failed; skip the rest of this host.
	 */
	bool give_up = false;

public:
	HostProbe(PortScanDiscoverer &_parent, IPv4Address _host) noexcept
		:parent(_parent), host(_host),
		 socket_event(parent.event_loop, BIND_THIS_METHOD(OnSocketReady)),
		 timeout_event(parent.event_loop, BIND_THIS_METHOD(OnTimeout)),
		 defer_next(parent.event_loop, BIND_THIS_METHOD(OnDeferredNext)) {}

	~HostProbe() noexcept {
		socket_event.Close();
	}

	HostProbe(const HostProbe &) = delete;
	HostProbe &operator=(const HostProbe &) = delete;

	const IPv4Address &GetHost() const noexcept {
		return host;
	}

	void Start() noexcept {
		port_index = 0;
		Connect();
	}

private:
	uint16_t GetPort() const noexcept {
		return parent.ports[port_index];
	}

	void Connect() noexcept;

	/**
	 * The current port is closed or did not answer in time.
	 */
	void Next() noexcept {
		socket_event.Close();
		timeout_event.Cancel();

		++port_index;
		if (port_index >= parent.ports.size())
			parent.OnProbeDone(*this, 0);
		else
			Connect();
	}

	void Found() noexcept {
		socket_event.Close();
		timeout_event.Cancel();

		parent.OnProbeDone(*this, GetPort());
	}

	/* callback for #socket_event */
	void OnSocketReady(unsigned events) noexcept;

	/* callback for #timeout_event */
	void OnTimeout() noexcept {
		Next();
	}

	/* callback for #defer_next */
	void OnDeferredNext() noexcept {
		if (give_up)
			parent.OnProbeDone(*this, 0);
		else
			Next();
	}
};

void
PortScanDiscoverer::HostProbe::Connect() noexcept
{
	UniqueSocketDescriptor fd;
	if (!fd.CreateNonBlock(AF_INET, SOCK_STREAM, 0)) {
		/* probably out of file descriptors; give up on
		   this host */
		FmtWarning(port_scan_domain, "Failed to create socket: {}",
			   std::make_exception_ptr(MakeSocketError("socket() failed")));
		give_up = true;
		defer_next.Schedule();
		return;
	}

	IPv4Address address = host;
	address.SetPort(GetPort());

	if (!fd.Connect(address)) {
		const auto e = GetSocketError();
		if (!IsSocketErrorConnectWouldBlock(e)) {
			defer_next.Schedule();
			return;
		}
	}

	/* an immediately established connection is reported as
	   "writable" by the next epoll_wait() */
	socket_event.Open(fd.Release());
	socket_event.ScheduleWrite();
	timeout_event.Schedule(parent.config.connect_timeout);
}

void
PortScanDiscoverer::HostProbe::OnSocketReady(unsigned) noexcept
{
	if (socket_event.GetSocket().GetError() == 0)
		Found();
	else
		Next();
}

PortScanDiscoverer::PortScanDiscoverer(EventLoop &_event_loop,
				       const PortScanConfig &_config,
				       DiscoveryListener &_listener) noexcept
	:Discoverer(_listener), event_loop(_event_loop), config(_config),
	 ports(config.ports),
	 defer_finished(event_loop, BIND_THIS_METHOD(OnDeferredFinished))
{
	PrioritizeKnownPorts(ports);
}

PortScanDiscoverer::~PortScanDiscoverer() noexcept
{
	Stop();
}

void
PortScanDiscoverer::Start()
{
	if (ports.empty())
		throw std::runtime_error("No ports to scan");

	if (config.subnet != 0)
		hosts = ListSubnetHosts(config.subnet);
	else
		hosts = ListSubnetHosts(ListLocalInterfaces());

	if (hosts.empty())
		throw std::runtime_error("No local IPv4 network found");

	FmtDebug(port_scan_domain, "Scanning {} ports on {} hosts",
		 ports.size(), hosts.size());

	next_host = 0;
	n_found = 0;
	running = true;
	Fill();
}

void
PortScanDiscoverer::Stop() noexcept
{
	running = false;
	defer_finished.Cancel();

	probes.clear_and_dispose([](HostProbe *p){
		delete p;
	});
}

void
PortScanDiscoverer::Fill() noexcept
{
	const std::size_t max_probes = std::max(config.max_sockets, 1U);

	while (running && probes.size() < max_probes &&
	       next_host < hosts.size()) {
		auto *probe = new HostProbe(*this, hosts[next_host++]);
		probes.push_back(*probe);
		probe->Start();
	}

	if (running && probes.empty() && next_host >= hosts.size())
		defer_finished.Schedule();
}

void
PortScanDiscoverer::OnProbeDone(HostProbe &probe, uint16_t open_port) noexcept
{
	const auto host = HostToString(probe.GetHost());

	probes.erase(probes.iterator_to(probe));
	delete &probe;

	if (open_port != 0) {
		++n_found;
		FmtDebug(port_scan_domain, "Found open port {}:{}",
			 host, open_port);
		listener.OnDeviceFound(MakePortScanDevice(host, open_port));
	}

	Fill();
}

void
PortScanDiscoverer::OnDeferredFinished() noexcept
{
	running = false;

	FmtDebug(port_scan_domain, "Scan of {} hosts finished: {} devices",
		 hosts.size(), n_found);

	listener.OnDiscovererFinished(DiscoveryMethod::PORT_SCAN);
}
