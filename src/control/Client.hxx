// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Control.hxx"

#include <chrono>
#include <exception>
#include <string>

class EventLoop;
class CurlGlobal;

struct ControlConfig {
	/**
	 * The maximum duration of each HTTP request.
	 */
	std::chrono::milliseconds timeout{5000};

	/**
	 * The pause between SetAVTransportURI and Play.
	 */
	std::chrono::milliseconds settle_delay{200};

	/**
	 * Send a GET request to the control URL before the SOAP
	 * actions?  Its outcome is only logged.
	 */
	bool probe = false;
};

class TransportInfoHandler {
public:
	/**
	 * @param state the CurrentTransportState, e.g. "PLAYING"
	 */
	virtual void OnTransportInfo(std::string &&state) noexcept = 0;
	virtual void OnTransportInfoError(std::exception_ptr error) noexcept = 0;
};

/**
 * Controls UPnP AVTransport:1 renderers with SOAP requests.
 */
class SoapControlClient final : public DeviceControl {
	EventLoop &event_loop;
	CurlGlobal &curl;

	const ControlConfig config;

public:
	SoapControlClient(EventLoop &_event_loop, CurlGlobal &_curl,
			  const ControlConfig &_config) noexcept
		:event_loop(_event_loop), curl(_curl), config(_config) {}

	/**
	 * SetAVTransportURI, settle delay, Play.
	 */
	std::unique_ptr<ControlOperation>
	PushClip(const Device &device, std::string_view media_url,
		 ControlHandler &handler) override;

	/**
	 * Send the "Stop" action.
	 *
	 * Throws on (local) error.
	 */
	std::unique_ptr<ControlOperation>
	StopPlayback(const Device &device, ControlHandler &handler);

	/**
	 * Query the transport state with "GetTransportInfo".
	 *
	 * Throws on (local) error.
	 */
	std::unique_ptr<ControlOperation>
	GetTransportInfo(const Device &device, TransportInfoHandler &handler);
};
