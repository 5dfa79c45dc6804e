// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Protocol.hxx"

#include <cstdint>
#include <string>
#include <string_view>

namespace Gelf {

enum class Compression : uint_least8_t {
	NONE,
	GZIP,
	ZLIB,
};

struct Config {
	/**
	 * The address of the GELF server ("host:port").  If empty,
	 * records are written to the console.
	 */
	std::string address;

	/**
	 * The maximum size of one datagram.  Larger (compressed)
	 * records are split into chunks.
	 */
	std::size_t chunk_size = DEFAULT_CHUNK_SIZE;

	Compression compression = Compression::GZIP;

	/**
	 * The zlib compression level (-1 = default, 0..9).  Ignored
	 * for #Compression::NONE.
	 */
	int compression_level = 9;

	/**
	 * The number of record bytes which fit into one chunk.
	 */
	constexpr std::size_t GetChunkDataSize() const noexcept {
		return chunk_size - CHUNK_HEADER_SIZE;
	}

	/**
	 * Throws std::invalid_argument if a setting is out of range.
	 */
	void Check() const;
};

/**
 * Parse a compression name ("none", "gzip", "zlib").
 *
 * Throws std::invalid_argument on error.
 */
Compression
ParseCompression(std::string_view s);

[[gnu::const]]
std::string_view
ToString(Compression compression) noexcept;

/**
 * Parse a zlib compression level (-1..9).
 *
 * Throws std::invalid_argument on error.
 */
int
ParseCompressionLevel(const char *s);

/**
 * Parse a datagram size limit.
 *
 * Throws std::invalid_argument on error.
 */
std::size_t
ParseChunkSize(const char *s);

} // namespace Gelf
