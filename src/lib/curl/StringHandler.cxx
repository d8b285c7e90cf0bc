// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringHandler.hxx"

#include <stdexcept>

void
StringCurlResponseHandler::OnHeaders(unsigned status, Curl::Headers &&headers)
{
	response.status = status;
	response.headers = std::move(headers);
}

void
StringCurlResponseHandler::OnData(std::span<const std::byte> data)
{
	if (response.body.size() + data.size() > max_size)
		throw std::runtime_error("Response body is too large");

	response.body.append(reinterpret_cast<const char *>(data.data()),
			     data.size());
}

void
StringCurlResponseHandler::OnEnd()
{
	OnStringResponse(std::move(response));
}
