// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Writer.hxx"
#include "Chunker.hxx"
#include "Compressor.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "Transport.hxx"
#include "io/Iovec.hxx"

#include <array>
#include <exception>
#include <system_error>

namespace Gelf {

Writer::Writer(const Config &config, Transport &_transport,
	       EntropySource &entropy)
	:Writer(config,
		MakeCompressor(config.compression, config.compression_level),
		_transport, entropy) {}

Writer::Writer(const Config &config, std::unique_ptr<Compressor> _compressor,
	       Transport &_transport, EntropySource &entropy)
	:transport(_transport), id_generator(entropy),
	 compressor(std::move(_compressor)),
	 chunk_size(config.chunk_size),
	 chunk_data_size(config.GetChunkDataSize())
{
	config.Check();
}

Writer::~Writer() noexcept = default;

std::size_t
Writer::Write(std::span<const std::byte> src)
{
	const auto payload = compressor->Compress(src);

	if (payload.size() > chunk_size)
		return WriteChunked(payload);

	const std::array v{MakeIovec(std::span{payload})};

	try {
		return transport.Send(v);
	} catch (const std::system_error &) {
		std::throw_with_nested(PartialSendError{0, payload.size()});
	}
}

std::size_t
Writer::WriteChunked(std::span<const std::byte> payload)
{
	/* check the limit before consuming entropy; FrameChunks()
	   checks again */
	const std::size_t count = CountChunks(payload.size(), chunk_data_size);
	if (count > MAX_CHUNK_COUNT)
		throw TooManyChunksError{count, MAX_CHUNK_COUNT};

	const auto chunks = FrameChunks(payload, chunk_data_size,
					id_generator.Next());

	std::size_t sent = 0;

	for (const auto &chunk : chunks) {
		const std::array v{
			MakeIovecT(chunk.header),
			MakeIovec(chunk.payload),
		};

		try {
			transport.Send(v);
		} catch (...) {
			/* the chunks which were already sent are lost;
			   the server will discard them after its
			   reassembly timeout */
			std::throw_with_nested(PartialSendError{sent, payload.size()});
		}

		sent += chunk.payload.size();
	}

	return sent;
}

} // namespace Gelf
