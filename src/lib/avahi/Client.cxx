// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Client.hxx"
#include "ConnectionListener.hxx"
#include "Error.hxx"

#include <avahi-common/error.h>

namespace Avahi {

Client::Client(EventLoop &event_loop, ConnectionListener &_listener)
	:poll(event_loop), listener(_listener)
{
	int error;
	client = avahi_client_new(&poll, AvahiClientFlags(0),
				  ClientCallback, this, &error);
	if (client == nullptr)
		throw MakeError(error, "Failed to connect to Avahi daemon");
}

Client::~Client() noexcept
{
	if (client != nullptr)
		avahi_client_free(client);
}

inline void
Client::ClientCallback(AvahiClient *c, AvahiClientState state) noexcept
{
	switch (state) {
	case AVAHI_CLIENT_S_RUNNING:
		if (!connected) {
			connected = true;
			listener.OnAvahiConnect(c);
		}

		break;

	case AVAHI_CLIENT_FAILURE:
		if (connected) {
			connected = false;
			listener.OnAvahiDisconnect();
		}

		listener.OnAvahiError(std::make_exception_ptr(MakeError(*c, "Avahi connection error")));
		break;

	case AVAHI_CLIENT_S_COLLISION:
	case AVAHI_CLIENT_S_REGISTERING:
	case AVAHI_CLIENT_CONNECTING:
		break;
	}
}

void
Client::ClientCallback(AvahiClient *c, AvahiClientState state,
		       void *userdata) noexcept
{
	auto &client = *(Client *)userdata;
	client.ClientCallback(c, state);
}

} // namespace Avahi
