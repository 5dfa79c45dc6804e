// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "RConnectSocket.hxx"
#include "Resolver.hxx"
#include "AddressInfo.hxx"
#include "SocketError.hxx"
#include "UniqueSocketDescriptor.hxx"

#include <exception>
#include <stdexcept>

#include <errno.h>
#include <netdb.h>

using Clock = std::chrono::steady_clock;

static void
ConnectWait(SocketDescriptor s, const SocketAddress address,
	    std::chrono::milliseconds timeout)
{
	if (s.Connect(address))
		return;

	const auto connect_error = GetSocketError();
	if (!IsSocketErrorConnectWouldBlock(connect_error))
		throw MakeSocketError(connect_error, "Failed to connect");

	/* connecting a datagram socket does not block on Linux, but
	   other socket families may */

	int w = s.WaitWritable(static_cast<int>(timeout.count()));
	if (w < 0)
		throw MakeSocketError("Connect wait error");
	else if (w == 0)
		throw MakeSocketError(ETIMEDOUT, "Connect timeout");

	int err = s.GetError();
	if (err != 0)
		throw MakeSocketError(err, "Failed to connect");
}

static std::chrono::milliseconds
GetRemaining(Clock::time_point deadline) noexcept
{
	const auto now = Clock::now();
	if (now >= deadline)
		return {};

	return std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
}

UniqueSocketDescriptor
ResolveConnectSocket(const char *host_and_port, int default_port,
		     const struct addrinfo &hints,
		     std::chrono::milliseconds timeout)
{
	const auto deadline = Clock::now() + timeout;

	const auto ail = Resolve(host_and_port, default_port, hints, timeout);

	std::exception_ptr error;
	for (const auto &ai : ail) {
		try {
			UniqueSocketDescriptor s;
			if (!s.CreateNonBlock(ai.GetFamily(), ai.GetType(),
					      ai.GetProtocol()))
				throw MakeSocketError("Failed to create socket");

			ConnectWait(s, ai, GetRemaining(deadline));
			return s;
		} catch (...) {
			error = std::current_exception();
		}
	}

	if (error)
		std::rethrow_exception(error);

	throw std::runtime_error{"No address"};
}

UniqueSocketDescriptor
ResolveConnectDatagramSocket(const char *host_and_port, int default_port,
			     std::chrono::milliseconds timeout)
{
	/* no AI_ADDRCONFIG: loopback addresses must resolve on hosts
	   without a configured network interface */
	static constexpr struct addrinfo hints{
		.ai_flags = 0,
		.ai_family = AF_UNSPEC,
		.ai_socktype = SOCK_DGRAM,
	};

	return ResolveConnectSocket(host_and_port, default_port, hints,
				    timeout);
}
