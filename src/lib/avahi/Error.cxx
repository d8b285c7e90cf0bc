// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Error.hxx"

#include <avahi-client/client.h>
#include <avahi-common/error.h>

#include <fmt/format.h>

namespace Avahi {

Error
MakeError(int error, const char *msg) noexcept
{
	return {error, fmt::format("{}: {}", msg, avahi_strerror(error)).c_str()};
}

Error
MakeError(AvahiClient &client, const char *msg) noexcept
{
	return MakeError(avahi_client_errno(&client), msg);
}

} // namespace Avahi
