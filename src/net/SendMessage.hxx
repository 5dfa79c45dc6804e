// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>

struct iovec;
class SocketDescriptor;

/**
 * Send one datagram assembled from the given buffers with
 * sendmsg() on a connected socket.
 *
 * Throws std::system_error on error.
 *
 * @return the number of bytes accepted by the kernel
 */
std::size_t
SendMessage(SocketDescriptor s, std::span<const struct iovec> v, int flags);
