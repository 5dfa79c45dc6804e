// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/*
 * Definitions for the GELF (Graylog Extended Log Format) datagram
 * transport.
 */

#include <array>
#include <cstddef>
#include <cstdint>

namespace Gelf {

/*

  Each record (a GELF JSON document, optionally compressed) is
  transmitted in one datagram.  If it does not fit, it is split into
  up to 128 chunks; each chunk is a datagram starting with the
  #ChunkHeader followed by a slice of the record.  All chunks of a
  record share the same random message id.  The receiver reassembles
  the record by concatenating the chunk payloads in sequence order.

  Integers are in network byte order (big-endian).

 */

/**
 * The default port of a GELF UDP input.
 */
static constexpr uint_least16_t DEFAULT_PORT = 12201;

/**
 * The default maximum datagram size.  This fits into the common WAN
 * path MTU (1500 minus IP/UDP headers and some tunnel overhead).
 */
static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1420;

/**
 * The largest payload of a UDP/IPv4 datagram.
 */
static constexpr std::size_t MAX_CHUNK_SIZE = 65507;

/**
 * The maximum number of chunks of one record.
 */
static constexpr std::size_t MAX_CHUNK_COUNT = 128;

/**
 * The two bytes at the beginning of each chunk.
 */
static constexpr std::array CHUNK_MAGIC{std::byte{0x1e}, std::byte{0x0f}};

/**
 * Identifies all chunks belonging to one record.
 */
using MessageId = std::array<std::byte, 8>;

struct ChunkHeader {
	std::array<std::byte, 2> magic;

	MessageId message_id;

	/**
	 * The zero-based index of this chunk.
	 */
	uint8_t sequence;

	/**
	 * The total number of chunks of this record.
	 */
	uint8_t count;

	constexpr bool IsValid() const noexcept {
		return magic == CHUNK_MAGIC && count > 0 &&
			count <= MAX_CHUNK_COUNT && sequence < count;
	}
};

static_assert(sizeof(ChunkHeader) == 12);
static_assert(alignof(ChunkHeader) == 1);

static constexpr std::size_t CHUNK_HEADER_SIZE = sizeof(ChunkHeader);

} // namespace Gelf
