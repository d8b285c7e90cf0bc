// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Spectrum.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringSplit.hxx"

#include <algorithm>
#include <charconv>

static uint16_t
ParsePort(std::string_view s)
{
	unsigned value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value);
	if (ec != std::errc{} || ptr != s.data() + s.size())
		throw FmtRuntimeError("Not a port number: \"{}\"", s);

	if (value == 0 || value > 0xffff)
		throw FmtRuntimeError("Port number out of range: {}", value);

	return value;
}

static void
AddPort(std::vector<uint16_t> &v, uint16_t port) noexcept
{
	if (std::find(v.begin(), v.end(), port) == v.end())
		v.push_back(port);
}

std::vector<uint16_t>
ParsePortSpectrum(std::string_view s)
{
	std::vector<uint16_t> result;

	ForEachSplit(s, ',', [&result](std::string_view item){
		const auto [a, b] = Split(item, '-');
		const uint16_t first = ParsePort(a);

		if (b.data() == nullptr) {
			AddPort(result, first);
			return;
		}

		const uint16_t last = ParsePort(b);
		if (last < first)
			throw FmtRuntimeError("Malformed port range: \"{}\"",
					      item);

		for (unsigned port = first; port <= last; ++port)
			AddPort(result, port);
	});

	if (result.empty())
		throw std::runtime_error("Empty port list");

	return result;
}

void
MergePortSpectrum(std::vector<uint16_t> &dest,
		  const std::vector<uint16_t> &src) noexcept
{
	for (const auto port : src)
		AddPort(dest, port);
}
