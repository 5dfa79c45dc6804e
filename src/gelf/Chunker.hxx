// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Protocol.hxx"

#include <cstddef>
#include <span>
#include <vector>

namespace Gelf {

/**
 * One chunk of a record: a header plus a slice of the (compressed)
 * record.  The payload points into the caller's buffer.
 */
struct Chunk {
	ChunkHeader header;

	std::span<const std::byte> payload;

	constexpr std::size_t GetDatagramSize() const noexcept {
		return sizeof(header) + payload.size();
	}
};

/**
 * Calculate the number of chunks needed for a record of the given
 * size.
 *
 * @param capacity the payload size of one chunk (the datagram size
 * limit minus #CHUNK_HEADER_SIZE)
 */
constexpr std::size_t
CountChunks(std::size_t size, std::size_t capacity) noexcept
{
	return (size + capacity - 1) / capacity;
}

/**
 * Split the record into chunks of #capacity bytes (only the last one
 * may be shorter).
 *
 * Throws #TooManyChunksError if more than #MAX_CHUNK_COUNT chunks
 * would be needed.
 */
std::vector<Chunk>
FrameChunks(std::span<const std::byte> payload, std::size_t capacity,
	    const MessageId &message_id);

/**
 * Parse a received chunk datagram.  The returned payload points into
 * the given buffer.
 *
 * Throws #ProtocolError on error.
 */
Chunk
ParseChunk(std::span<const std::byte> datagram);

/**
 * Does this datagram start with #CHUNK_MAGIC?
 */
[[gnu::pure]]
bool
IsChunk(std::span<const std::byte> datagram) noexcept;

} // namespace Gelf
