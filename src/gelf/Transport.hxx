// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "net/UniqueSocketDescriptor.hxx"

#include <chrono>
#include <cstddef>
#include <span>

struct iovec;

namespace Gelf {

/**
 * Sends datagrams to the GELF server.  There is no acknowledgement,
 * no retry and no flow control.
 */
class Transport {
public:
	virtual ~Transport() noexcept = default;

	/**
	 * Send one datagram assembled from the given buffers.
	 *
	 * Throws #PartialSendError if fewer bytes were accepted,
	 * std::system_error on socket errors.
	 *
	 * @return the number of bytes sent
	 */
	std::size_t Send(std::span<const struct iovec> v);

protected:
	/**
	 * @return the number of bytes accepted
	 */
	virtual std::size_t SendDatagram(std::span<const struct iovec> v) = 0;
};

/**
 * A #Transport which owns a connected UDP socket.  Sending on it is
 * thread-safe.
 */
class UdpTransport final : public Transport {
	UniqueSocketDescriptor fd;

public:
	static constexpr std::chrono::seconds DIAL_TIMEOUT{15};

	/**
	 * Resolve the address ("host:port") and connect a datagram
	 * socket to it.
	 *
	 * Throws #TransportUnavailableError on error.
	 */
	explicit UdpTransport(const char *address,
			      std::chrono::milliseconds timeout=DIAL_TIMEOUT);

	/**
	 * Use an existing connected datagram socket.
	 */
	explicit UdpTransport(UniqueSocketDescriptor &&_fd) noexcept
		:fd(std::move(_fd)) {}

	SocketDescriptor GetSocket() const noexcept {
		return fd;
	}

protected:
	std::size_t SendDatagram(std::span<const struct iovec> v) override;
};

} // namespace Gelf
