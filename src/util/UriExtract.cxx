// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UriExtract.hxx"
#include "ASCII.hxx"
#include "StringSplit.hxx"

#include <charconv>

static constexpr bool
IsValidSchemeStart(char ch) noexcept
{
	return IsAlphaASCII(ch);
}

static constexpr bool
IsValidSchemeChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '+' || ch == '.' || ch == '-';
}

[[gnu::pure]]
static bool
IsValidScheme(std::string_view p) noexcept
{
	if (p.empty() || !IsValidSchemeStart(p.front()))
		return false;

	for (std::size_t i = 1; i < p.size(); ++i)
		if (!IsValidSchemeChar(p[i]))
			return false;

	return true;
}

/**
 * Return the URI part after the scheme specification (and after the
 * double slash).
 */
[[gnu::pure]]
static std::string_view
uri_after_scheme(std::string_view uri) noexcept
{
	if (uri.length() > 2 &&
	    uri[0] == '/' && uri[1] == '/' && uri[2] != '/')
		return uri.substr(2);

	auto colon = uri.find(':');
	if (colon == std::string_view::npos ||
	    !IsValidScheme(uri.substr(0, colon)))
		return {};

	uri = uri.substr(colon + 1);
	if (uri.size() < 2 || uri[0] != '/' || uri[1] != '/')
		return {};

	return uri.substr(2);
}

std::string_view
uri_get_scheme(std::string_view uri) noexcept
{
	auto end = uri.find("://");
	if (end == std::string_view::npos)
		return {};

	return uri.substr(0, end);
}

std::string_view
uri_get_host_and_port(std::string_view uri) noexcept
{
	auto ap = uri_after_scheme(uri);
	if (ap.data() == nullptr)
		return {};

	auto authority = ap.substr(0, ap.find_first_of("/?#"));

	/* strip user information */
	const auto at = authority.rfind('@');
	if (at != std::string_view::npos)
		authority = authority.substr(at + 1);

	return authority;
}

std::string_view
uri_get_host(std::string_view uri) noexcept
{
	const auto authority = uri_get_host_and_port(uri);
	if (!authority.empty() && authority.front() == '[') {
		/* IPv6 literal */
		const auto end = authority.find(']');
		if (end == std::string_view::npos)
			return {};

		return authority.substr(1, end - 1);
	}

	return SplitLast(authority, ':').first;
}

uint16_t
uri_get_port(std::string_view uri) noexcept
{
	const auto authority = uri_get_host_and_port(uri);
	const auto colon = authority.rfind(':');
	if (colon == std::string_view::npos ||
	    authority.find(']', colon) != std::string_view::npos)
		return 0;

	const auto s = authority.substr(colon + 1);
	unsigned port;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       port);
	if (ec != std::errc{} || ptr != s.data() + s.size() || port > 0xffff)
		return 0;

	return port;
}

std::string_view
uri_get_path(std::string_view uri) noexcept
{
	auto ap = uri_after_scheme(uri);
	if (ap.data() != nullptr) {
		auto slash = ap.find('/');
		if (slash == std::string_view::npos)
			return {};
		return ap.substr(slash);
	}

	return uri;
}
