// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <chrono>

struct addrinfo;
class AddressInfoList;

/**
 * Resolve a "host:port" string (or "[ipv6]:port").  If no port is
 * specified, the given default port is used.  Gives up after the
 * given duration.
 *
 * Throws std::runtime_error on error.
 */
AddressInfoList
Resolve(const char *host_and_port, int default_port,
	const struct addrinfo &hints,
	std::chrono::milliseconds timeout);
