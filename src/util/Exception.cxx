// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Exception.hxx"
#include "ASCII.hxx"

#include <utility>

/**
 * Append the message, collapsing runs of whitespace (e.g. line breaks
 * from an HTTP response body) into single spaces.
 */
static void
AppendSanitize(std::string &dest, const char *src) noexcept
{
	bool space = false;
	while (char ch = *src++) {
		if (IsWhitespaceNotNull(ch)) {
			space = !dest.empty();
			continue;
		}

		if (space) {
			space = false;
			dest.push_back(' ');
		}

		dest.push_back(ch);
	}
}

template<typename T>
static void
AppendNestedMessage(std::string &result, T &&e,
		    const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(std::forward<T>(e));
	} catch (const std::exception &nested) {
		result += separator;
		AppendSanitize(result, nested.what());
		AppendNestedMessage(result, nested, fallback, separator);
	} catch (...) {
		result += separator;
		result += fallback;
	}
}

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	std::string result;
	AppendSanitize(result, e.what());
	AppendNestedMessage(result, e, fallback, separator);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(std::move(ep));
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
