// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>

#include <sys/socket.h>

/**
 * A reference to a "struct sockaddr" which is owned by somebody
 * else.
 */
class SocketAddress {
public:
	using size_type = socklen_t;

private:
	const struct sockaddr *address = nullptr;
	size_type size = 0;

public:
	SocketAddress() = default;

	constexpr SocketAddress(const struct sockaddr *_address,
				size_type _size) noexcept
		:address(_address), size(_size) {}

	constexpr const struct sockaddr *GetAddress() const noexcept {
		return address;
	}

	constexpr size_type GetSize() const noexcept {
		return size;
	}

	constexpr int GetFamily() const noexcept {
		return address->sa_family;
	}
};
