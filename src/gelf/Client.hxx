// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Sink.hxx"
#include "Transport.hxx"
#include "EntropySource.hxx"
#include "Writer.hxx"

namespace Gelf {

struct Config;

/**
 * A GELF client which owns its UDP socket.
 */
class UdpClient final : public Sink {
	UdpTransport transport;

	UrandomEntropySource entropy;

	Writer writer;

public:
	/**
	 * Connect to the server specified in the #Config.
	 *
	 * Throws #TransportUnavailableError if the server cannot be
	 * dialed, std::invalid_argument if the #Config is invalid.
	 */
	explicit UdpClient(const Config &config);

	/**
	 * Use an existing connected datagram socket.
	 */
	UdpClient(const Config &config, UniqueSocketDescriptor &&fd);

	SocketDescriptor GetSocket() const noexcept {
		return transport.GetSocket();
	}

	std::size_t Write(std::span<const std::byte> src) override {
		return writer.Write(src);
	}
};

} // namespace Gelf
