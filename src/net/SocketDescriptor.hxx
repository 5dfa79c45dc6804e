// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>

#include <sys/types.h> // for ssize_t

struct msghdr;
class SocketAddress;

/**
 * An OO wrapper for a socket descriptor.  This class does not own
 * the socket; see #UniqueSocketDescriptor for that.
 */
class SocketDescriptor {
protected:
	int fd;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	constexpr void Set(int _fd) noexcept {
		fd = _fd;
	}

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(-1);
	}

	/**
	 * Close the socket descriptor.  It is legal to call it on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 */
	void Close() noexcept;

	/**
	 * Create a socket with SOCK_CLOEXEC.
	 *
	 * @return true on success, false on error (with errno set)
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	/**
	 * Like Create(), but enable non-blocking mode.
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	/**
	 * @return the value of SO_ERROR, or an errno value if
	 * getsockopt() has failed
	 */
	[[gnu::pure]]
	int GetError() const noexcept;

	bool Connect(SocketAddress address) const noexcept;

	/**
	 * Wait until the socket becomes writable (e.g. after a
	 * non-blocking connect()).
	 *
	 * @param timeout_ms the timeout in milliseconds; negative
	 * means wait forever
	 * @return 1 if writable, 0 on timeout, -1 on error (with
	 * errno set)
	 */
	int WaitWritable(int timeout_ms) const noexcept;

	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept;

	/**
	 * Wrapper for sendmsg().
	 */
	ssize_t Send(const struct msghdr &msg, int flags=0) const noexcept;
};
