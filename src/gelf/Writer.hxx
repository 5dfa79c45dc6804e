// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Sink.hxx"
#include "MessageId.hxx"

#include <memory>

namespace Gelf {

struct Config;
class Compressor;
class EntropySource;
class Transport;

/**
 * Compresses each record and sends it to the #Transport, split into
 * chunks if it does not fit into one datagram.
 *
 * Write() keeps all per-record data on the stack; it may be called
 * from multiple threads if the #Transport and the #EntropySource
 * allow it.
 */
class Writer final : public Sink {
	Transport &transport;

	const MessageIdGenerator id_generator;

	const std::unique_ptr<Compressor> compressor;

	/**
	 * The maximum datagram size.
	 */
	const std::size_t chunk_size;

	/**
	 * The number of record bytes per chunk.
	 */
	const std::size_t chunk_data_size;

public:
	/**
	 * Throws std::invalid_argument if the #Config is invalid.
	 */
	Writer(const Config &config, Transport &_transport,
	       EntropySource &entropy);

	/**
	 * Use the given #Compressor instead of the one selected by
	 * Config::compression.
	 */
	Writer(const Config &config, std::unique_ptr<Compressor> _compressor,
	       Transport &_transport, EntropySource &entropy);

	~Writer() noexcept override;

	Writer(const Writer &) = delete;
	Writer &operator=(const Writer &) = delete;

	/**
	 * Throws #EncodingError, #EntropyError, #TooManyChunksError
	 * or #PartialSendError.
	 *
	 * @return the number of compressed bytes sent
	 */
	std::size_t Write(std::span<const std::byte> src) override;

private:
	std::size_t WriteChunked(std::span<const std::byte> payload);
};

} // namespace Gelf
