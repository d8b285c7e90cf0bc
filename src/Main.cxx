// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "blast/Config.hxx"
#include "blast/Service.hxx"
#include "blast/Observer.hxx"
#include "blast/MediaServer.hxx"
#include "config/Data.hxx"
#include "control/Client.hxx"
#include "discovery/Glue.hxx"
#include "discovery/portscan/Result.hxx"
#include "event/Loop.hxx"
#include "event/SignalMonitor.hxx"
#include "lib/curl/Init.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <stdlib.h>

static constexpr Domain main_domain("main");

/**
 * Prints the progress of a #BlastService to stdout and quits the
 * #EventLoop when the service returns to #BlastState::IDLE.
 */
class ConsoleObserver final : public BlastObserver {
	EventLoop &event_loop;

	const bool print_devices;

public:
	bool failed = false;

	ConsoleObserver(EventLoop &_event_loop, bool _print_devices) noexcept
		:event_loop(_event_loop), print_devices(_print_devices) {}

	/* virtual methods from class BlastObserver */
	void OnBlastState(BlastState state) noexcept override {
		FmtInfo(main_domain, "state: {}", ToString(state));

		if (state == BlastState::IDLE)
			event_loop.Break();
	}

	void OnBlastMetrics(std::shared_ptr<const MetricsSnapshot>) noexcept override {
	}

	void OnDeviceStatus(const Device &device,
			    DeviceStatus status) noexcept override {
		if (status == DeviceStatus::DISCOVERED && !print_devices)
			return;

		fmt::print("{:<10} {}:{} {:?} ({}, {})\n",
			   ToString(status),
			   device.ip_address, device.port,
			   device.friendly_name,
			   ToString(device.method),
			   device.manufacturer.empty()
			   ? "unknown manufacturer"
			   : device.manufacturer.c_str());
	}

	void OnBlastError(std::exception_ptr error) noexcept override {
		failed = true;
		PrintException(error);
	}

	void OnBlastSummary(const MetricsSnapshot &m) noexcept override;
};

void
ConsoleObserver::OnBlastSummary(const MetricsSnapshot &m) noexcept
{
	fmt::print("\n"
		   "devices discovered: {} in {} ms\n"
		   "devices playing:    {} of {} ({:.0f}%)\n"
		   "total blast time:   {} ms\n",
		   m.devices_discovered, m.discovery_duration.count(),
		   m.successes, m.attempts, m.GetSuccessRate() * 100,
		   m.total_blast_duration.count());

	if (m.successes > 0)
		fmt::print("average SOAP time:  {} ms\n",
			   m.GetAverageSoapTime().count());

	if (const auto *fastest = m.GetFastest())
		fmt::print("fastest device:     {} ({} ms)\n",
			   fastest->name, fastest->duration.count());

	if (const auto *slowest = m.GetSlowest())
		fmt::print("slowest device:     {} ({} ms)\n",
			   slowest->name, slowest->duration.count());

	for (const auto &[manufacturer, counters] : m.manufacturers)
		fmt::print("  {:<20} {}/{}\n", manufacturer,
			   counters.successes, counters.attempts);

	for (const auto &i : m.device_results)
		if (!i.succeeded)
			fmt::print("  failed: {} ({}:{}): {}\n",
				   i.name, i.key.ip, i.key.port, i.error);
}

/**
 * Cancels the blast on SIGINT and SIGTERM.
 */
struct ShutdownHandler {
	EventLoop &event_loop;
	BlastService &service;

	void OnSignal(int signo) noexcept {
		FmtNotice(main_domain, "caught signal {}, shutting down", signo);
		service.Stop();
		event_loop.Break();
	}
};

static int
blaster_main(int argc, char **argv)
{
	CommandLineOptions options;
	ConfigData raw_config;
	ParseCommandLine(argc, argv, options, raw_config);

	log_early_init(options.verbose);
	log_init(raw_config, options.verbose);

	BlastConfig config = LoadBlastConfig(raw_config);
	if (options.media_url != nullptr)
		config.media_url = options.media_url;
	if (options.discovery_timeout)
		config.discovery.timeout = *options.discovery_timeout;
	if (options.concurrency > 0)
		config.concurrency = options.concurrency;

	EventLoop event_loop;

	CurlInit curl_init(event_loop);

	DefaultDiscovererFactory discoverer_factory(event_loop, *curl_init,
						    config.discovery);
	SoapControlClient control(event_loop, *curl_init, config.control);
	ExternalMediaServer media_server(event_loop, config.media_url);

	ConsoleObserver observer(event_loop, options.discover_only);

	BlastService service(event_loop, config, discoverer_factory,
			     control, media_server, observer);

	ShutdownHandler shutdown_handler{event_loop, service};
	SignalMonitor signal_monitor(event_loop,
				     BIND_METHOD(shutdown_handler,
						 &ShutdownHandler::OnSignal));
	signal_monitor.Register(SIGINT);
	signal_monitor.Register(SIGTERM);

	if (options.device != nullptr) {
		const auto key = ParseDeviceKey(options.device);
		service.StartSingle(MakePortScanDevice(key.ip, key.port));
	} else if (options.discover_only)
		service.StartDiscoverOnly();
	else
		service.StartBlast();

	event_loop.Run();

	return observer.failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

int
main(int argc, char **argv) noexcept
try {
	return blaster_main(argc, argv);
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
