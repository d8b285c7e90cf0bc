// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "StubRenderer.hxx"
#include "BreakTimer.hxx"
#include "control/Client.hxx"
#include "control/Result.hxx"
#include "device/Device.hxx"
#include "event/Loop.hxx"
#include "lib/curl/Init.hxx"

#include <gtest/gtest.h>

#include <optional>

using namespace std::chrono_literals;

namespace {

class ResultHandler final : public ControlHandler, public TransportInfoHandler {
	EventLoop &event_loop;

public:
	std::optional<ControlResult> result;

	std::string transport_state;
	std::exception_ptr transport_error;

	explicit ResultHandler(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	void OnControlResult(ControlResult &&_result) noexcept override {
		result = std::move(_result);
		event_loop.Break();
	}

	void OnTransportInfo(std::string &&state) noexcept override {
		transport_state = std::move(state);
		event_loop.Break();
	}

	void OnTransportInfoError(std::exception_ptr error) noexcept override {
		transport_error = std::move(error);
		event_loop.Break();
	}
};

struct SoapControlClientTest : ::testing::Test {
	EventLoop event_loop;
	CurlInit curl{event_loop};
	StubRenderer renderer{event_loop};
	ResultHandler handler{event_loop};

	ControlConfig config;

	SoapControlClientTest() noexcept {
		config.timeout = 1s;
		config.settle_delay = 10ms;
	}

	Device MakeDevice() const noexcept {
		Device device("127.0.0.1", renderer.GetPort(),
			      DiscoveryMethod::SSDP);
		device.control_url = "/MediaRenderer/AVTransport/Control";
		return device;
	}

	void Run() noexcept {
		BreakTimer timer(event_loop, 5s);
		event_loop.Run();
		EXPECT_FALSE(timer.expired);
	}
};

} // anonymous namespace

TEST_F(SoapControlClientTest, PushClip)
{
	renderer.replies["SetAVTransportURI"] = {200, StubRenderer::MakeResponse("SetAVTransportURI")};
	renderer.replies["Play"] = {200, StubRenderer::MakeResponse("Play")};

	SoapControlClient client(event_loop, *curl, config);
	const auto device = MakeDevice();
	auto operation = client.PushClip(device,
					 "http://10.0.0.2:8080/clip.mp3?a=1&b=2",
					 handler);
	Run();

	ASSERT_TRUE(handler.result);
	EXPECT_TRUE(handler.result->succeeded) << handler.result->error;
	EXPECT_EQ(handler.result->device, device.GetKey());
	EXPECT_TRUE(handler.result->error.empty());

	EXPECT_EQ(renderer.GetActions(),
		  (std::vector<std::string>{"SetAVTransportURI", "Play"}));

	const auto &set_uri = renderer.requests.front();
	EXPECT_EQ(set_uri.path, "/MediaRenderer/AVTransport/Control");
	EXPECT_NE(set_uri.body.find("<CurrentURI>http://10.0.0.2:8080/clip.mp3?a=1&amp;b=2</CurrentURI>"),
		  std::string::npos);
	EXPECT_NE(set_uri.body.find("<InstanceID>0</InstanceID>"),
		  std::string::npos);

	const auto &play = renderer.requests.back();
	EXPECT_NE(play.body.find("<Speed>1</Speed>"), std::string::npos);
}

/**
 * Renderers which answer "200 OK" with an empty or broken body have
 * still accepted the action.
 */
TEST_F(SoapControlClientTest, LenientSuccessBody)
{
	renderer.replies["SetAVTransportURI"] = {200, "<s:Envelope><s:Body>"};
	renderer.replies["Play"] = {200, ""};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.PushClip(MakeDevice(), "http://10.0.0.2/x.mp3",
					 handler);
	Run();

	ASSERT_TRUE(handler.result);
	EXPECT_TRUE(handler.result->succeeded) << handler.result->error;
	EXPECT_EQ(renderer.GetActions(),
		  (std::vector<std::string>{"SetAVTransportURI", "Play"}));
}

TEST_F(SoapControlClientTest, TransportInfoWithoutBody)
{
	renderer.replies["GetTransportInfo"] = {200, ""};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.GetTransportInfo(MakeDevice(), handler);
	Run();

	EXPECT_TRUE(handler.transport_error);
	EXPECT_TRUE(handler.transport_state.empty());
}

TEST_F(SoapControlClientTest, ProbeForbidden)
{
	config.probe = true;
	renderer.replies["GET"] = {403, "Forbidden"};
	renderer.replies["SetAVTransportURI"] = {200, StubRenderer::MakeResponse("SetAVTransportURI")};
	renderer.replies["Play"] = {200, StubRenderer::MakeResponse("Play")};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.PushClip(MakeDevice(), "http://10.0.0.2/x.mp3",
					 handler);
	Run();

	ASSERT_TRUE(handler.result);
	EXPECT_TRUE(handler.result->succeeded) << handler.result->error;
	EXPECT_EQ(renderer.GetActions(),
		  (std::vector<std::string>{"GET", "SetAVTransportURI", "Play"}));
}

TEST_F(SoapControlClientTest, SetUriRejected)
{
	/* no reply configured: 404 */
	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.PushClip(MakeDevice(), "http://10.0.0.2/x.mp3",
					 handler);
	Run();

	ASSERT_TRUE(handler.result);
	EXPECT_FALSE(handler.result->succeeded);
	EXPECT_NE(handler.result->error.find("SetAVTransportURI failed"),
		  std::string::npos);
	EXPECT_NE(handler.result->error.find("404"), std::string::npos);

	/* no Play after a failed SetAVTransportURI */
	EXPECT_EQ(renderer.GetActions(),
		  (std::vector<std::string>{"SetAVTransportURI"}));
}

TEST_F(SoapControlClientTest, Fault)
{
	renderer.replies["SetAVTransportURI"] = {200, StubRenderer::MakeResponse("SetAVTransportURI")};
	renderer.replies["Play"] = {500, StubRenderer::MakeFault(701, "Transition not available")};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.PushClip(MakeDevice(), "http://10.0.0.2/x.mp3",
					 handler);
	Run();

	ASSERT_TRUE(handler.result);
	EXPECT_FALSE(handler.result->succeeded);
	EXPECT_NE(handler.result->error.find("Play failed"), std::string::npos);
	EXPECT_NE(handler.result->error.find("UPnPError 701: Transition not available"),
		  std::string::npos);
}

TEST_F(SoapControlClientTest, Timeout)
{
	config.timeout = 200ms;
	renderer.replies["SetAVTransportURI"] = {200, StubRenderer::MakeResponse("SetAVTransportURI")};
	renderer.replies["Play"] = {200, {}, true};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.PushClip(MakeDevice(), "http://10.0.0.2/x.mp3",
					 handler);
	Run();

	ASSERT_TRUE(handler.result);
	EXPECT_FALSE(handler.result->succeeded);
	EXPECT_NE(handler.result->error.find("Play failed"), std::string::npos);
	EXPECT_GE(handler.result->duration, 200ms);
}

TEST_F(SoapControlClientTest, Cancel)
{
	renderer.replies["SetAVTransportURI"] = {200, {}, true};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.PushClip(MakeDevice(), "http://10.0.0.2/x.mp3",
					 handler);

	RunFor(event_loop, 50ms);
	operation.reset();
	RunFor(event_loop, 50ms);

	EXPECT_FALSE(handler.result);
}

TEST_F(SoapControlClientTest, StopPlayback)
{
	renderer.replies["Stop"] = {200, StubRenderer::MakeResponse("Stop")};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.StopPlayback(MakeDevice(), handler);
	Run();

	ASSERT_TRUE(handler.result);
	EXPECT_TRUE(handler.result->succeeded) << handler.result->error;
	EXPECT_EQ(renderer.GetActions(), (std::vector<std::string>{"Stop"}));
}

TEST_F(SoapControlClientTest, GetTransportInfo)
{
	renderer.replies["GetTransportInfo"] = {
		200,
		StubRenderer::MakeResponse("GetTransportInfo",
					   "<CurrentTransportState>PLAYING</CurrentTransportState>"
					   "<CurrentTransportStatus>OK</CurrentTransportStatus>"
					   "<CurrentSpeed>1</CurrentSpeed>"),
	};

	SoapControlClient client(event_loop, *curl, config);
	auto operation = client.GetTransportInfo(MakeDevice(), handler);
	Run();

	EXPECT_FALSE(handler.transport_error);
	EXPECT_EQ(handler.transport_state, "PLAYING");
}
