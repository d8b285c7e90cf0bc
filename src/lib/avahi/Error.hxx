// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <stdexcept>

struct AvahiClient;

namespace Avahi {

class Error final : public std::runtime_error {
	int code;

public:
	Error(int _code, const char *msg) noexcept
		:std::runtime_error(msg), code(_code) {}

	int GetCode() const noexcept {
		return code;
	}
};

[[gnu::cold]]
Error
MakeError(int error, const char *msg) noexcept;

/**
 * Build an #Error from the client's last error code.
 */
[[gnu::cold]]
Error
MakeError(AvahiClient &client, const char *msg) noexcept;

} // namespace Avahi
