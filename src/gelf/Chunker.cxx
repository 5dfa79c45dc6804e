// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Chunker.hxx"
#include "Error.hxx"

#include <algorithm> // for std::equal()
#include <cassert>

namespace Gelf {

std::vector<Chunk>
FrameChunks(std::span<const std::byte> payload, std::size_t capacity,
	    const MessageId &message_id)
{
	assert(capacity > 0);

	const std::size_t count = CountChunks(payload.size(), capacity);
	if (count > MAX_CHUNK_COUNT)
		throw TooManyChunksError{count, MAX_CHUNK_COUNT};

	std::vector<Chunk> chunks;
	chunks.reserve(count);

	for (std::size_t i = 0; i < count; ++i) {
		const auto slice = payload.subspan(i * capacity,
						   std::min(capacity, payload.size() - i * capacity));

		chunks.push_back({
			.header = {
				.magic = CHUNK_MAGIC,
				.message_id = message_id,
				.sequence = static_cast<uint8_t>(i),
				.count = static_cast<uint8_t>(count),
			},
			.payload = slice,
		});
	}

	return chunks;
}

bool
IsChunk(std::span<const std::byte> datagram) noexcept
{
	return datagram.size() >= CHUNK_MAGIC.size() &&
		std::equal(CHUNK_MAGIC.begin(), CHUNK_MAGIC.end(),
			   datagram.begin());
}

Chunk
ParseChunk(std::span<const std::byte> datagram)
{
	if (datagram.size() < CHUNK_HEADER_SIZE)
		throw ProtocolError{"Chunk is too short"};

	if (!IsChunk(datagram))
		throw ProtocolError{"Wrong chunk magic"};

	Chunk chunk;
	std::copy_n(datagram.begin(), CHUNK_HEADER_SIZE,
		    reinterpret_cast<std::byte *>(&chunk.header));
	chunk.payload = datagram.subspan(CHUNK_HEADER_SIZE);

	if (!chunk.header.IsValid())
		throw ProtocolError{"Malformed chunk header"};

	return chunk;
}

} // namespace Gelf
