// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "control/Soap.hxx"
#include "control/SoapCall.hxx"
#include "lib/expat/ExpatParser.hxx"

#include <gtest/gtest.h>

TEST(Soap, Envelope)
{
	const SoapArgument args[] = {
		{"InstanceID", "0"},
		{"CurrentURI", "http://10.0.0.1:8080/media/current.mp3?a=1&b=<2>"},
		{"CurrentURIMetaData", ""},
	};

	EXPECT_EQ(BuildSoapEnvelope("SetAVTransportURI", args),
		  "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
		  "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\""
		  " s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
		  "<s:Body>"
		  "<u:SetAVTransportURI xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\">"
		  "<InstanceID>0</InstanceID>"
		  "<CurrentURI>http://10.0.0.1:8080/media/current.mp3?a=1&amp;b=&lt;2&gt;</CurrentURI>"
		  "<CurrentURIMetaData></CurrentURIMetaData>"
		  "</u:SetAVTransportURI>"
		  "</s:Body></s:Envelope>");
}

TEST(Soap, ActionHeader)
{
	EXPECT_EQ(BuildSoapActionHeader("Play"),
		  "\"urn:schemas-upnp-org:service:AVTransport:1#Play\"");
}

TEST(Soap, ParseResponse)
{
	const auto response = ParseSoapResponse(
		"<?xml version=\"1.0\"?>"
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
		"<s:Body>"
		"<u:GetTransportInfoResponse xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\">"
		"<CurrentTransportState>PLAYING</CurrentTransportState>"
		"<CurrentTransportStatus>OK</CurrentTransportStatus>"
		"<CurrentSpeed>1</CurrentSpeed>"
		"</u:GetTransportInfoResponse>"
		"</s:Body>"
		"</s:Envelope>");

	EXPECT_FALSE(response.IsFault());
	EXPECT_EQ(response.element, "GetTransportInfoResponse");
	ASSERT_NE(response.GetArgument("CurrentTransportState"), nullptr);
	EXPECT_EQ(*response.GetArgument("CurrentTransportState"), "PLAYING");
	EXPECT_EQ(response.arguments.size(), 3u);
	EXPECT_EQ(response.GetArgument("InstanceID"), nullptr);
}

TEST(Soap, EmptyResponse)
{
	/* "PlayResponse" has no arguments */
	const auto response = ParseSoapResponse(
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
		"<s:Body><u:PlayResponse xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\"/></s:Body>"
		"</s:Envelope>");

	EXPECT_EQ(response.element, "PlayResponse");
	EXPECT_TRUE(response.arguments.empty());
}

TEST(Soap, Fault)
{
	const auto response = ParseSoapResponse(
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
		"<s:Body><s:Fault>"
		"<faultcode>s:Client</faultcode>"
		"<faultstring>UPnPError</faultstring>"
		"<detail><UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\">"
		"<errorCode>714</errorCode>"
		"<errorDescription>Illegal MIME-type</errorDescription>"
		"</UPnPError></detail>"
		"</s:Fault></s:Body></s:Envelope>");

	ASSERT_TRUE(response.IsFault());
	EXPECT_EQ(response.fault.fault_code, "s:Client");
	EXPECT_EQ(response.fault.fault_string, "UPnPError");
	EXPECT_EQ(response.fault.error_code, 714u);
	EXPECT_EQ(response.fault.ToString(), "UPnPError 714: Illegal MIME-type");
}

TEST(Soap, FaultToString)
{
	SoapFault fault;
	EXPECT_EQ(fault.ToString(), "Unspecified SOAP fault");

	fault.fault_code = "s:Server";
	EXPECT_EQ(fault.ToString(), "s:Server");

	fault.fault_string = "Internal Error";
	EXPECT_EQ(fault.ToString(), "Internal Error");

	fault.error_code = 501;
	EXPECT_EQ(fault.ToString(), "UPnPError 501");
}

TEST(Soap, Malformed)
{
	EXPECT_THROW(ParseSoapResponse("<html><body>Forbidden</body></html>"),
		     std::runtime_error);
	EXPECT_THROW(ParseSoapResponse("<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
				       "<s:Body></s:Body></s:Envelope>"),
		     std::runtime_error);
	EXPECT_THROW(ParseSoapResponse("<s:Envelope"), ExpatError);
}

TEST(Soap, DeviceUrl)
{
	EXPECT_EQ(MakeDeviceUrl("192.168.1.20", 1400,
				"/MediaRenderer/AVTransport/Control"),
		  "http://192.168.1.20:1400/MediaRenderer/AVTransport/Control");
	EXPECT_EQ(MakeDeviceUrl("10.0.0.2", 80, "AVTransport/control"),
		  "http://10.0.0.2:80/AVTransport/control");
	EXPECT_EQ(MakeDeviceUrl("10.0.0.2", 80, "http://10.0.0.3:49152/ctl"),
		  "http://10.0.0.3:49152/ctl");
}
