// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Poll.hxx"

#include <avahi-client/client.h>

class EventLoop;

namespace Avahi {

class ConnectionListener;

/**
 * A connection to the Avahi daemon.  Unlike a plain AvahiClient, the
 * connection is established synchronously, so a missing daemon is
 * reported by the constructor.
 */
class Client final {
	Poll poll;

	ConnectionListener &listener;

	AvahiClient *client = nullptr;

	bool connected = false;

public:
	/**
	 * Throws #Avahi::Error if the daemon is not reachable.
	 */
	Client(EventLoop &event_loop, ConnectionListener &_listener);
	~Client() noexcept;

	Client(const Client &) = delete;
	Client &operator=(const Client &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return poll.GetEventLoop();
	}

	bool IsConnected() const noexcept {
		return connected;
	}

	AvahiClient *GetClient() noexcept {
		return client;
	}

private:
	void ClientCallback(AvahiClient *c, AvahiClientState state) noexcept;
	static void ClientCallback(AvahiClient *c, AvahiClientState state,
				   void *userdata) noexcept;
};

} // namespace Avahi
