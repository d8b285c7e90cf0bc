// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <exception>

struct AvahiClient;

namespace Avahi {

class ConnectionListener {
public:
	/**
	 * The connection to the Avahi daemon has been established.
	 *
	 * Note that this may be called again after a disconnect.
	 */
	virtual void OnAvahiConnect(AvahiClient *client) noexcept = 0;
	virtual void OnAvahiDisconnect() noexcept = 0;

	/**
	 * The connection has failed fatally.
	 */
	virtual void OnAvahiError(std::exception_ptr e) noexcept = 0;
};

} // namespace Avahi
