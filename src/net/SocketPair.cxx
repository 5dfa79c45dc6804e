// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketPair.hxx"
#include "SocketError.hxx"

#include <sys/socket.h>

std::pair<UniqueSocketDescriptor, UniqueSocketDescriptor>
CreateDatagramSocketPairNonBlock()
{
	int sv[2];
	if (socketpair(AF_LOCAL, SOCK_DGRAM|SOCK_CLOEXEC|SOCK_NONBLOCK, 0, sv) < 0)
		throw MakeSocketError("socketpair() failed");

	return {
		UniqueSocketDescriptor{sv[0]},
		UniqueSocketDescriptor{sv[1]},
	};
}
