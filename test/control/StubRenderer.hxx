// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "event/SocketEvent.hxx"
#include "net/IPv4Address.hxx"
#include "net/SocketDescriptor.hxx"
#include "net/SocketError.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <cstdlib>
#include <list>
#include <map>
#include <span>
#include <string>
#include <vector>

#include <sys/socket.h>

/**
 * A minimal HTTP/1.1 server on the loopback interface which answers
 * SOAP requests with canned responses.  It runs on the #EventLoop
 * of the code under test.
 */
class StubRenderer final {
public:
	struct Reply {
		unsigned status = 200;
		std::string body;

		/**
		 * Never answer (to provoke a timeout).
		 */
		bool hang = false;
	};

	struct Request {
		/**
		 * The SOAP action name, or the HTTP method if there
		 * was no SOAPACTION header.
		 */
		std::string action;

		std::string path;
		std::string body;
	};

private:
	class Connection final {
		StubRenderer &parent;
		SocketEvent event;
		std::string input;

	public:
		Connection(StubRenderer &_parent, EventLoop &event_loop,
			   SocketDescriptor fd) noexcept
			:parent(_parent),
			 event(event_loop, BIND_THIS_METHOD(OnSocketReady), fd)
		{
			event.ScheduleRead();
		}

		~Connection() noexcept {
			event.Close();
		}

		Connection(const Connection &) = delete;
		Connection &operator=(const Connection &) = delete;

	private:
		void OnSocketReady(unsigned events) noexcept;
		void Respond(const Reply &reply) noexcept;
	};

	SocketEvent listener;

	std::list<Connection> connections;

public:
	/**
	 * Replies by action name; unknown actions get a 404.
	 */
	std::map<std::string, Reply, std::less<>> replies;

	std::vector<Request> requests;

	explicit StubRenderer(EventLoop &event_loop)
		:listener(event_loop, BIND_THIS_METHOD(OnAccept))
	{
		SocketDescriptor fd;
		if (!fd.CreateNonBlock(AF_INET, SOCK_STREAM, 0))
			throw MakeSocketError("Failed to create socket");

		listener.Open(fd);

		if (!fd.Bind(IPv4Address::Loopback(0)))
			throw MakeSocketError("Failed to bind");

		if (!fd.Listen(8))
			throw MakeSocketError("Failed to listen");

		listener.ScheduleRead();
	}

	~StubRenderer() noexcept {
		connections.clear();
		listener.Close();
	}

	uint16_t GetPort() const noexcept {
		return listener.GetSocket().GetLocalAddress().GetPort();
	}

	/**
	 * Make a successful response envelope for the given action.
	 */
	static std::string MakeResponse(std::string_view action,
					std::string_view arguments={}) noexcept {
		return fmt::format("<?xml version=\"1.0\"?>"
				   "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
				   "<s:Body><u:{0}Response xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\">"
				   "{1}</u:{0}Response></s:Body></s:Envelope>",
				   action, arguments);
	}

	static std::string MakeFault(unsigned error_code,
				     std::string_view description) noexcept {
		return fmt::format("<?xml version=\"1.0\"?>"
				   "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
				   "<s:Body><s:Fault>"
				   "<faultcode>s:Client</faultcode>"
				   "<faultstring>UPnPError</faultstring>"
				   "<detail><UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\">"
				   "<errorCode>{}</errorCode>"
				   "<errorDescription>{}</errorDescription>"
				   "</UPnPError></detail>"
				   "</s:Fault></s:Body></s:Envelope>",
				   error_code, description);
	}

	std::vector<std::string> GetActions() const noexcept {
		std::vector<std::string> result;
		for (const auto &i : requests)
			result.push_back(i.action);
		return result;
	}

private:
	void OnAccept(unsigned) noexcept {
		auto fd = listener.GetSocket().AcceptNonBlock();
		if (fd.IsDefined())
			connections.emplace_back(*this, listener.GetEventLoop(),
						 fd);
	}

	void Remove(Connection &c) noexcept {
		connections.remove_if([&c](const Connection &i){
			return &i == &c;
		});
	}

	/**
	 * Parse a complete request.  Returns false if more data is
	 * needed.
	 */
	static bool ParseRequest(std::string_view input,
				 Request &request) noexcept;
};

inline bool
StubRenderer::ParseRequest(std::string_view input, Request &request) noexcept
{
	const auto header_end = input.find("\r\n\r\n");
	if (header_end == input.npos)
		return false;

	std::string_view headers = input.substr(0, header_end);
	const std::string_view body = input.substr(header_end + 4);

	auto eol = headers.find("\r\n");
	const std::string_view request_line = headers.substr(0, eol);
	headers = eol == headers.npos
		? std::string_view{}
		: headers.substr(eol + 2);

	const auto space1 = request_line.find(' ');
	const auto space2 = request_line.find(' ', space1 + 1);
	request.action = request_line.substr(0, space1);
	request.path = request_line.substr(space1 + 1, space2 - space1 - 1);

	std::size_t content_length = 0;

	while (!headers.empty()) {
		eol = headers.find("\r\n");
		const std::string_view line = headers.substr(0, eol);
		headers = eol == headers.npos
			? std::string_view{}
			: headers.substr(eol + 2);

		const auto colon = line.find(':');
		if (colon == line.npos)
			continue;

		const auto name = line.substr(0, colon);
		const auto value = Strip(line.substr(colon + 1));

		if (StringEqualsCaseASCII(name, "content-length"))
			content_length = std::strtoul(std::string{value}.c_str(),
						      nullptr, 10);
		else if (StringEqualsCaseASCII(name, "soapaction")) {
			/* "urn:...:AVTransport:1#Play" */
			const auto hash = value.rfind('#');
			if (hash != value.npos) {
				auto action = value.substr(hash + 1);
				if (!action.empty() && action.back() == '"')
					action.remove_suffix(1);
				request.action = action;
			}
		}
	}

	if (body.size() < content_length)
		return false;

	request.body = body.substr(0, content_length);
	return true;
}

inline void
StubRenderer::Connection::OnSocketReady(unsigned) noexcept
{
	char buffer[4096];
	const auto nbytes = event.GetSocket().Receive(std::as_writable_bytes(std::span{buffer}));
	if (nbytes <= 0) {
		parent.Remove(*this);
		return;
	}

	input.append(buffer, nbytes);

	Request request;
	if (!ParseRequest(input, request))
		return;

	event.CancelRead();
	input.clear();

	auto &p = parent;
	p.requests.push_back(request);

	const auto i = p.replies.find(request.action);
	if (i == p.replies.end())
		Respond({404, "Not Found"});
	else if (!i->second.hang)
		Respond(i->second);
}

inline void
StubRenderer::Connection::Respond(const Reply &reply) noexcept
{
	const auto response =
		fmt::format("HTTP/1.1 {} Stub\r\n"
			    "Content-Type: text/xml; charset=\"utf-8\"\r\n"
			    "Content-Length: {}\r\n"
			    "Connection: close\r\n"
			    "\r\n"
			    "{}",
			    reply.status, reply.body.size(), reply.body);

	(void)event.GetSocket().Send(std::as_bytes(std::span{response}));
	event.GetSocket().ShutdownWrite();

	/* wait for the client to close the connection */
	event.ScheduleRead();
}
