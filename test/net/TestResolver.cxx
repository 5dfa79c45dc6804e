// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "net/Resolver.hxx"
#include "net/RConnectSocket.hxx"
#include "net/AddressInfo.hxx"
#include "net/UniqueSocketDescriptor.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>

using namespace std::chrono_literals;

static constexpr struct addrinfo datagram_hints{
	.ai_flags = 0,
	.ai_family = AF_UNSPEC,
	.ai_socktype = SOCK_DGRAM,
};

static unsigned
GetPort(SocketAddress address) noexcept
{
	switch (address.GetFamily()) {
	case AF_INET:
		return ntohs(reinterpret_cast<const struct sockaddr_in *>(address.GetAddress())->sin_port);

	case AF_INET6:
		return ntohs(reinterpret_cast<const struct sockaddr_in6 *>(address.GetAddress())->sin6_port);

	default:
		return 0;
	}
}

TEST(Resolver, DefaultPort)
{
	const auto ail = Resolve("127.0.0.1", 12201, datagram_hints, 15s);

	unsigned n = 0;
	for (const auto &ai : ail) {
		EXPECT_EQ(ai.GetFamily(), AF_INET);
		EXPECT_EQ(ai.GetType(), SOCK_DGRAM);
		EXPECT_EQ(GetPort(ai), 12201u);
		++n;
	}

	EXPECT_GT(n, 0u);
}

TEST(Resolver, ExplicitPort)
{
	const auto ail = Resolve("127.0.0.1:514", 12201, datagram_hints, 15s);
	for (const auto &ai : ail)
		EXPECT_EQ(GetPort(ai), 514u);

	const auto ail6 = Resolve("[::1]:514", 12201, datagram_hints, 15s);
	for (const auto &ai : ail6) {
		EXPECT_EQ(ai.GetFamily(), AF_INET6);
		EXPECT_EQ(GetPort(ai), 514u);
	}
}

TEST(Resolver, Malformed)
{
	EXPECT_THROW(Resolve("", 12201, datagram_hints, 15s), std::runtime_error);
	EXPECT_THROW(Resolve("?", 12201, datagram_hints, 15s), std::runtime_error);
	EXPECT_THROW(Resolve("127.0.0.1:", 12201, datagram_hints, 15s), std::runtime_error);
	EXPECT_THROW(Resolve("127.0.0.1/foo", 12201, datagram_hints, 15s), std::runtime_error);
	EXPECT_THROW(Resolve("127.0.0.1:no-such-service-here", 12201, datagram_hints, 15s),
		     std::runtime_error);
}

TEST(Resolver, Deadline)
{
	/* with no time left, the lookup either completes immediately
	   or gives up; it never waits for the resolver */
	const auto start = std::chrono::steady_clock::now();

	try {
		const auto ail = Resolve("localhost", 12201, datagram_hints, 0ms);
		EXPECT_NE(ail.begin(), ail.end());
	} catch (const std::runtime_error &) {
	}

	EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(RConnectSocket, Datagram)
{
	const auto s = ResolveConnectDatagramSocket("127.0.0.1", 12201, 15s);
	EXPECT_TRUE(s.IsDefined());
}
