// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "UniqueSocketDescriptor.hxx"

#include <utility>

/**
 * Create two connected non-blocking AF_LOCAL datagram sockets
 * (which preserve message boundaries).
 *
 * Throws std::system_error on error.
 */
std::pair<UniqueSocketDescriptor, UniqueSocketDescriptor>
CreateDatagramSocketPairNonBlock();
