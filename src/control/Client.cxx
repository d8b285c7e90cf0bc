// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Client.hxx"
#include "Result.hxx"
#include "SoapCall.hxx"
#include "device/Device.hxx"
#include "event/FineTimerEvent.hxx"
#include "event/Loop.hxx"
#include "lib/curl/Request.hxx"
#include "lib/curl/StringHandler.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "Log.hxx"

#include <algorithm>
#include <stdexcept>

static constexpr Domain control_domain("control");

static constexpr std::chrono::milliseconds MAX_PROBE_TIMEOUT{2000};

using std::string_view_literals::operator""sv;

namespace {

/**
 * Common code for all operations: one #SoapCall at a time, timing
 * and error reporting.
 */
class SoapOperation : public ControlOperation, public SoapCallHandler {
protected:
	EventLoop &event_loop;
	CurlGlobal &curl;
	const ControlConfig &config;

	const DeviceKey key;
	const std::string url;

	const Event::TimePoint start_time;

	std::unique_ptr<SoapCall> call;

	SoapOperation(EventLoop &_event_loop, CurlGlobal &_curl,
		      const ControlConfig &_config,
		      const Device &device) noexcept
		:event_loop(_event_loop), curl(_curl), config(_config),
		 key(device.GetKey()),
		 url(MakeDeviceUrl(device.ip_address, device.port,
				   device.control_url)),
		 start_time(event_loop.SteadyNow()) {}

	std::chrono::milliseconds GetElapsed() const noexcept {
		return std::chrono::duration_cast<std::chrono::milliseconds>(event_loop.SteadyNow() - start_time);
	}

	/**
	 * Throws on error.
	 */
	void Call(std::string_view action,
		  std::span<const SoapArgument> arguments) {
		FmtDebug(control_domain, "{} {}", action, url);

		call = std::make_unique<SoapCall>(curl, url.c_str(),
						  action, arguments,
						  config.timeout, *this);
		call->Start();
	}
};

/**
 * SetAVTransportURI, a short pause, Play.
 */
class PushClipOperation final
	: public SoapOperation, StringCurlResponseHandler
{
	ControlHandler &handler;

	const std::string media_url;

	FineTimerEvent settle_timer;

	/**
	 * The optional reachability probe.
	 */
	std::unique_ptr<CurlRequest> probe;

	enum class Step : uint8_t {
		PROBE,
		SET_URI,
		SETTLE,
		PLAY,
	} step = Step::PROBE;

public:
	PushClipOperation(EventLoop &_event_loop, CurlGlobal &_curl,
			  const ControlConfig &_config,
			  const Device &device, std::string_view _media_url,
			  ControlHandler &_handler) noexcept
		:SoapOperation(_event_loop, _curl, _config, device),
		 StringCurlResponseHandler(4096),
		 handler(_handler), media_url(_media_url),
		 settle_timer(event_loop, BIND_THIS_METHOD(OnSettleTimer)) {}

	/**
	 * Throws on error.
	 */
	void Start() {
		if (config.probe)
			StartProbe();
		else
			SetURI();
	}

private:
	void StartProbe() {
		step = Step::PROBE;

		probe = std::make_unique<CurlRequest>(curl, url.c_str(),
						      static_cast<StringCurlResponseHandler &>(*this));
		probe->SetOption(CURLOPT_TIMEOUT_MS,
				 static_cast<long>(std::min(config.timeout,
							    MAX_PROBE_TIMEOUT).count()));
		probe->Start();
	}

	void SetURI() {
		step = Step::SET_URI;

		const SoapArgument arguments[] = {
			{"InstanceID", "0"sv},
			{"CurrentURI", media_url},
			{"CurrentURIMetaData", ""sv},
		};

		Call("SetAVTransportURI", arguments);
	}

	void Play() {
		step = Step::PLAY;

		const SoapArgument arguments[] = {
			{"InstanceID", "0"sv},
			{"Speed", "1"sv},
		};

		Call("Play", arguments);
	}

	void Succeed() noexcept {
		FmtDebug(control_domain, "Playback started on {}",
			 ToString(key));
		handler.OnControlResult(ControlResult::Success(key, GetElapsed()));
	}

	void Fail(std::exception_ptr error) noexcept {
		FmtDebug(control_domain, "Control of {} failed: {}",
			 ToString(key), error);
		handler.OnControlResult(ControlResult::Failure(key, GetElapsed(),
							       std::move(error)));
	}

	/**
	 * The probe has finished (in whichever way); go on with the
	 * control sequence.
	 */
	void ProbeDone() noexcept {
		try {
			SetURI();
		} catch (...) {
			Fail(std::current_exception());
		}
	}

	void OnSettleTimer() noexcept {
		try {
			Play();
		} catch (...) {
			Fail(NestCurrentException(std::runtime_error("Play failed")));
		}
	}

	/* virtual methods from class SoapCallHandler */
	void OnSoapResponse(SoapResponse &&) noexcept override {
		switch (step) {
		case Step::SET_URI:
			step = Step::SETTLE;
			settle_timer.Schedule(config.settle_delay);
			break;

		case Step::PLAY:
			Succeed();
			break;

		case Step::PROBE:
		case Step::SETTLE:
			/* no SOAP call in these steps */
			break;
		}
	}

	void OnSoapError(std::exception_ptr error) noexcept override {
		/* a URI which was set without playback starting is
		   not a success either */
		Fail(NestException(std::move(error),
				   std::runtime_error(step == Step::SET_URI
						      ? "SetAVTransportURI failed"
						      : "Play failed")));
	}

	/* virtual methods from class StringCurlResponseHandler */
	void OnStringResponse(StringCurlResponse &&response) override {
		/* many renderers answer GET on the control URL with
		   403, 404 or 405 but accept SOAP requests there */
		FmtDebug(control_domain, "Probe of {}: status {}",
			 url, response.status);
		ProbeDone();
	}

	/* virtual methods from class CurlResponseHandler */
	void OnError(std::exception_ptr e) noexcept override {
		FmtDebug(control_domain, "Probe of {} failed: {}", url, e);
		ProbeDone();
	}
};

/**
 * A single action without output arguments (e.g. "Stop").
 */
class SimpleActionOperation final : public SoapOperation {
	ControlHandler &handler;

public:
	SimpleActionOperation(EventLoop &_event_loop, CurlGlobal &_curl,
			      const ControlConfig &_config,
			      const Device &device,
			      ControlHandler &_handler) noexcept
		:SoapOperation(_event_loop, _curl, _config, device),
		 handler(_handler) {}

	using SoapOperation::Call;

private:
	/* virtual methods from class SoapCallHandler */
	void OnSoapResponse(SoapResponse &&) noexcept override {
		handler.OnControlResult(ControlResult::Success(key, GetElapsed()));
	}

	void OnSoapError(std::exception_ptr error) noexcept override {
		handler.OnControlResult(ControlResult::Failure(key, GetElapsed(),
							       std::move(error)));
	}
};

class TransportInfoOperation final : public SoapOperation {
	TransportInfoHandler &handler;

public:
	TransportInfoOperation(EventLoop &_event_loop, CurlGlobal &_curl,
			       const ControlConfig &_config,
			       const Device &device,
			       TransportInfoHandler &_handler) noexcept
		:SoapOperation(_event_loop, _curl, _config, device),
		 handler(_handler) {}

	using SoapOperation::Call;

private:
	/* virtual methods from class SoapCallHandler */
	void OnSoapResponse(SoapResponse &&response) noexcept override {
		const auto *state = response.GetArgument("CurrentTransportState");
		if (state == nullptr) {
			handler.OnTransportInfoError(std::make_exception_ptr(std::runtime_error("No CurrentTransportState in response")));
			return;
		}

		handler.OnTransportInfo(std::string{*state});
	}

	void OnSoapError(std::exception_ptr error) noexcept override {
		handler.OnTransportInfoError(std::move(error));
	}
};

} // anonymous namespace

std::unique_ptr<ControlOperation>
SoapControlClient::PushClip(const Device &device, std::string_view media_url,
			    ControlHandler &handler)
{
	auto operation = std::make_unique<PushClipOperation>(event_loop, curl,
							     config, device,
							     media_url,
							     handler);
	operation->Start();
	return operation;
}

std::unique_ptr<ControlOperation>
SoapControlClient::StopPlayback(const Device &device, ControlHandler &handler)
{
	auto operation = std::make_unique<SimpleActionOperation>(event_loop,
								 curl, config,
								 device,
								 handler);

	const SoapArgument arguments[] = {
		{"InstanceID", "0"sv},
	};

	operation->Call("Stop", arguments);
	return operation;
}

std::unique_ptr<ControlOperation>
SoapControlClient::GetTransportInfo(const Device &device,
				    TransportInfoHandler &handler)
{
	auto operation = std::make_unique<TransportInfoOperation>(event_loop,
								  curl, config,
								  device,
								  handler);

	const SoapArgument arguments[] = {
		{"InstanceID", "0"sv},
	};

	operation->Call("GetTransportInfo", arguments);
	return operation;
}
