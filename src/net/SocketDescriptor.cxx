// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketDescriptor.hxx"
#include "IPv4Address.hxx"

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cerrno>

void
SocketDescriptor::Close() noexcept
{
	if (IsDefined())
		::close(Steal());
}

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
	int new_fd = socket(domain, type | SOCK_CLOEXEC | SOCK_NONBLOCK,
			    protocol);
	if (new_fd < 0)
		return false;

	fd = new_fd;
	return true;
}

int
SocketDescriptor::GetError() const noexcept
{
	int s_err = 0;
	socklen_t s_err_size = sizeof(s_err);
	return getsockopt(fd, SOL_SOCKET, SO_ERROR,
			  &s_err, &s_err_size) == 0
		? s_err
		: errno;
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	return setsockopt(fd, level, name, value, size) == 0;
}

bool
SocketDescriptor::SetReuseAddress(bool value) const noexcept
{
	return SetBoolOption(SOL_SOCKET, SO_REUSEADDR, value);
}

bool
SocketDescriptor::AddMembership(const IPv4Address &group) const noexcept
{
	struct ip_mreq r{};
	r.imr_multiaddr = group.GetAddress();
	r.imr_interface.s_addr = htonl(INADDR_ANY);
	return SetOption(IPPROTO_IP, IP_ADD_MEMBERSHIP, &r, sizeof(r));
}

bool
SocketDescriptor::SetMulticastTtl(int ttl) const noexcept
{
	return SetIntOption(IPPROTO_IP, IP_MULTICAST_TTL, ttl);
}

bool
SocketDescriptor::Bind(const IPv4Address &address) const noexcept
{
	return bind(fd, address.GetSockaddr(), address.GetSize()) == 0;
}

bool
SocketDescriptor::Listen(int backlog) const noexcept
{
	return listen(fd, backlog) == 0;
}

SocketDescriptor
SocketDescriptor::AcceptNonBlock() const noexcept
{
	return SocketDescriptor(accept4(fd, nullptr, nullptr,
					SOCK_CLOEXEC|SOCK_NONBLOCK));
}

bool
SocketDescriptor::Connect(const IPv4Address &address) const noexcept
{
	return connect(fd, address.GetSockaddr(), address.GetSize()) == 0;
}

IPv4Address
SocketDescriptor::GetLocalAddress() const noexcept
{
	struct sockaddr_in sin{};
	socklen_t size = sizeof(sin);
	if (getsockname(fd, reinterpret_cast<struct sockaddr *>(&sin),
			&size) < 0 || sin.sin_family != AF_INET)
		return IPv4Address{};

	return IPv4Address{sin};
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest, int flags) const noexcept
{
	return ::recv(fd, dest.data(), dest.size(), flags | MSG_DONTWAIT);
}

ssize_t
SocketDescriptor::Send(std::span<const std::byte> src, int flags) const noexcept
{
	return ::send(fd, src.data(), src.size(),
		      flags | MSG_DONTWAIT | MSG_NOSIGNAL);
}

ssize_t
SocketDescriptor::ReadFrom(std::span<std::byte> dest,
			   IPv4Address &address) const noexcept
{
	struct sockaddr_in sin{};
	socklen_t size = sizeof(sin);
	const auto nbytes = ::recvfrom(fd, dest.data(), dest.size(),
				       MSG_DONTWAIT,
				       reinterpret_cast<struct sockaddr *>(&sin),
				       &size);
	if (nbytes >= 0)
		address = IPv4Address{sin};

	return nbytes;
}

ssize_t
SocketDescriptor::WriteTo(std::span<const std::byte> src,
			  const IPv4Address &address) const noexcept
{
	return ::sendto(fd, src.data(), src.size(),
			MSG_DONTWAIT|MSG_NOSIGNAL,
			address.GetSockaddr(), address.GetSize());
}

void
SocketDescriptor::ShutdownWrite() const noexcept
{
	shutdown(fd, SHUT_WR);
}
