// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Request.hxx"
#include "Global.hxx"
#include "Handler.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <cassert>
#include <cstring>

CurlRequest::CurlRequest(CurlGlobal &_global, CurlEasy &&_easy,
			 CurlResponseHandler &_handler)
	:global(_global), handler(_handler), easy(std::move(_easy))
{
	error_buffer[0] = 0;
	SetupEasy();
}

CurlRequest::~CurlRequest() noexcept
{
	Stop();
}

void
CurlRequest::SetupEasy()
{
	easy.SetPrivate((void *)this);
	easy.SetUserAgent("blaster/" BLASTER_VERSION);
	easy.SetHeaderFunction(_HeaderFunction, this);
	easy.SetWriteFunction(WriteFunction, this);
	easy.SetNoProgress();
	easy.SetNoSignal();
	easy.SetErrorBuffer(error_buffer);
}

void
CurlRequest::Start()
{
	assert(!registered);

	global.Add(*this);
	registered = true;
}

void
CurlRequest::Stop() noexcept
{
	if (!registered)
		return;

	global.Remove(*this);
	registered = false;
}

void
CurlRequest::FinishHeaders()
{
	if (state != State::HEADERS)
		return;

	state = State::BODY;

	const long status = easy.GetResponseCode();
	handler.OnHeaders(status, std::move(headers));
}

void
CurlRequest::FinishBody()
{
	FinishHeaders();

	if (state != State::BODY)
		return;

	state = State::CLOSED;
	handler.OnEnd();
}

void
CurlRequest::Done(CURLcode result) noexcept
{
	Stop();

	try {
		if (postponed_error)
			std::rethrow_exception(postponed_error);

		if (result != CURLE_OK) {
			std::string_view msg = StripRight(std::string_view{error_buffer});
			if (msg.empty())
				msg = curl_easy_strerror(result);
			throw CurlError(result,
					fmt::format("CURL failed: {}",
						    msg).c_str());
		}

		FinishBody();
	} catch (...) {
		state = State::CLOSED;
		handler.OnError(std::current_exception());
	}
}

/**
 * Is this a "HTTP/1.1 100 Continue" (or similar) line which is
 * followed by the real status line?
 */
[[gnu::pure]]
static bool
IsInterimStatusLine(std::string_view s) noexcept
{
	return StringStartsWithCaseASCII(s, "HTTP/") &&
		s.find(" 1") != std::string_view::npos &&
		s.size() > 12 && s[9] == '1';
}

inline void
CurlRequest::HeaderFunction(std::string_view s) noexcept
{
	if (state > State::HEADERS)
		return;

	if (IsInterimStatusLine(s)) {
		headers.clear();
		return;
	}

	const auto colon = s.find(':');
	if (colon == std::string_view::npos)
		return;

	const auto name = Strip(s.substr(0, colon));
	const auto value = Strip(s.substr(colon + 1));
	if (name.empty())
		return;

	headers.emplace(ToLowerASCII(name), std::string{value});
}

std::size_t
CurlRequest::_HeaderFunction(char *ptr, std::size_t size, std::size_t nmemb,
			     void *stream) noexcept
{
	auto &c = *static_cast<CurlRequest *>(stream);

	size *= nmemb;

	c.HeaderFunction({ptr, size});
	return size;
}

inline std::size_t
CurlRequest::DataReceived(const void *ptr, std::size_t received_size) noexcept
{
	assert(received_size > 0);

	try {
		FinishHeaders();
		handler.OnData({static_cast<const std::byte *>(ptr),
				received_size});
		return received_size;
	} catch (...) {
		state = State::CLOSED;
		postponed_error = std::current_exception();

		/* returning 0 aborts the transfer; Done() will pass
		   the postponed error to the handler */
		return 0;
	}
}

std::size_t
CurlRequest::WriteFunction(char *ptr, std::size_t size, std::size_t nmemb,
			   void *stream) noexcept
{
	auto &c = *static_cast<CurlRequest *>(stream);

	size *= nmemb;
	if (size == 0)
		return 0;

	return c.DataReceived(ptr, size);
}
