// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <chrono>

struct addrinfo;
class UniqueSocketDescriptor;

/**
 * Resolve a host name and connect to the first address which
 * accepts the connection (synchronously).  The timeout covers both
 * the name lookup and the connect.
 *
 * Throws std::runtime_error (or std::system_error) on error; if all
 * addresses fail, the last error is rethrown.
 *
 * @return the connected socket (non-blocking)
 */
UniqueSocketDescriptor
ResolveConnectSocket(const char *host_and_port, int default_port,
		     const struct addrinfo &hints,
		     std::chrono::milliseconds timeout);

UniqueSocketDescriptor
ResolveConnectDatagramSocket(const char *host_and_port, int default_port,
			     std::chrono::milliseconds timeout);
