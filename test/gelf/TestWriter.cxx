// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fakes.hxx"
#include "gelf/Writer.hxx"
#include "gelf/Chunker.hxx"
#include "gelf/Compressor.hxx"
#include "gelf/Config.hxx"
#include "gelf/Error.hxx"
#include "lib/zlib/Inflate.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <map>
#include <thread>

using std::string_view_literals::operator""sv;

static constexpr std::size_t capacity = Gelf::DEFAULT_CHUNK_SIZE - Gelf::CHUNK_HEADER_SIZE;

static Gelf::Config
MakeConfig(Gelf::Compression compression)
{
	Gelf::Config config;
	config.compression = compression;
	return config;
}

static std::vector<std::byte>
MakePayload(std::size_t size)
{
	std::vector<std::byte> result(size);
	for (std::size_t i = 0; i < size; ++i)
		result[i] = static_cast<std::byte>(i * 13 + i / 256);
	return result;
}

/**
 * Parse the datagrams as chunks and concatenate their payloads.
 */
static std::vector<std::byte>
Reassemble(const std::vector<std::vector<std::byte>> &datagrams)
{
	std::vector<std::byte> result;

	for (std::size_t i = 0; i < datagrams.size(); ++i) {
		const auto chunk = Gelf::ParseChunk(datagrams[i]);
		EXPECT_EQ(chunk.header.sequence, i);
		EXPECT_EQ(chunk.header.count, datagrams.size());

		result.insert(result.end(),
			      chunk.payload.begin(), chunk.payload.end());
	}

	return result;
}

TEST(Writer, HelloWorld)
{
	RecordingTransport transport;
	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	EXPECT_EQ(writer.Write(AsBytes("hello world"sv)), 11u);

	const auto datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 1u);
	EXPECT_EQ(ToStringView(datagrams.front()), "hello world"sv);
}

TEST(Writer, GzipZeroes)
{
	RecordingTransport transport;
	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::GZIP), transport, entropy};

	const std::vector<std::byte> src(3000);
	const std::size_t nbytes = writer.Write(src);
	EXPECT_LT(nbytes, capacity);

	const auto datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 1u);
	EXPECT_EQ(datagrams.front().size(), nbytes);
	EXPECT_FALSE(Gelf::IsChunk(datagrams.front()));
	EXPECT_EQ(Inflate(datagrams.front(), DeflateFormat::GZIP), src);
}

TEST(Writer, UnchunkedThreshold)
{
	RecordingTransport transport;
	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	/* exactly the datagram size limit: not chunked */
	const auto limit = MakePayload(Gelf::DEFAULT_CHUNK_SIZE);
	EXPECT_EQ(writer.Write(limit), limit.size());

	auto datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 1u);
	EXPECT_EQ(datagrams.front(), limit);

	/* one byte more: two chunks */
	const auto larger = MakePayload(Gelf::DEFAULT_CHUNK_SIZE + 1);
	EXPECT_EQ(writer.Write(larger), larger.size());

	datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 3u);
	EXPECT_EQ(datagrams[1].size(), Gelf::DEFAULT_CHUNK_SIZE);
	EXPECT_EQ(datagrams[2].size(), Gelf::CHUNK_HEADER_SIZE + 13);

	datagrams.erase(datagrams.begin());
	EXPECT_EQ(Reassemble(datagrams), larger);
}

TEST(Writer, ChunkHeaders)
{
	RecordingTransport transport;
	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	const auto payload = MakePayload(3 * capacity);
	EXPECT_EQ(writer.Write(payload), payload.size());

	const auto datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 3u);

	for (std::size_t i = 0; i < datagrams.size(); ++i) {
		const auto &d = datagrams[i];
		ASSERT_EQ(d.size(), Gelf::DEFAULT_CHUNK_SIZE);

		EXPECT_EQ(d[0], std::byte{0x1e});
		EXPECT_EQ(d[1], std::byte{0x0f});

		/* message id from CountingEntropySource */
		for (std::size_t j = 0; j < 8; ++j)
			EXPECT_EQ(d[2 + j], static_cast<std::byte>(j));

		EXPECT_EQ(d[10], static_cast<std::byte>(i));
		EXPECT_EQ(d[11], std::byte{3});
	}

	EXPECT_EQ(Reassemble(datagrams), payload);

	/* the next record gets a new message id */
	writer.Write(payload);
	const auto next = transport.GetDatagrams();
	ASSERT_EQ(next.size(), 6u);
	EXPECT_EQ(next[3][2], std::byte{8});
}

TEST(Writer, MaximumChunks)
{
	RecordingTransport transport;
	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	const auto payload = MakePayload(128 * capacity);
	EXPECT_EQ(writer.Write(payload), payload.size());

	const auto datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 128u);
	EXPECT_EQ(Reassemble(datagrams), payload);
}

TEST(Writer, TooManyChunks)
{
	RecordingTransport transport;
	FailingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	const auto payload = MakePayload(128 * capacity + 1);

	try {
		writer.Write(payload);
		FAIL();
	} catch (const Gelf::TooManyChunksError &e) {
		EXPECT_EQ(e.GetCount(), 129u);
		EXPECT_EQ(e.GetMax(), 128u);
	}

	EXPECT_EQ(transport.size(), 0u);

	/* rejected before a message id was generated */
	EXPECT_EQ(entropy.n_calls, 0u);
}

TEST(Writer, SendFailure)
{
	RecordingTransport transport;
	transport.FailAt(1);

	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	const auto payload = MakePayload(3 * capacity);

	try {
		writer.Write(payload);
		FAIL();
	} catch (const Gelf::PartialSendError &e) {
		/* only the first chunk was sent */
		EXPECT_EQ(e.GetSent(), capacity);
		EXPECT_EQ(e.GetExpected(), payload.size());

		try {
			std::rethrow_if_nested(e);
			FAIL();
		} catch (const std::system_error &cause) {
			EXPECT_TRUE(IsErrno(cause, ENOBUFS));
		}
	}

	/* no retry, no more chunks */
	EXPECT_EQ(transport.size(), 1u);
}

TEST(Writer, UnchunkedSendFailure)
{
	RecordingTransport transport;
	transport.FailAt(0);

	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	try {
		writer.Write(AsBytes("hello world"sv));
		FAIL();
	} catch (const Gelf::PartialSendError &e) {
		EXPECT_EQ(e.GetSent(), 0u);
		EXPECT_EQ(e.GetExpected(), 11u);
	}
}

TEST(Writer, PartialSend)
{
	RecordingTransport transport;
	transport.Truncate(5);

	CountingEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	try {
		writer.Write(AsBytes("hello world"sv));
		FAIL();
	} catch (const Gelf::PartialSendError &e) {
		EXPECT_EQ(e.GetSent(), 5u);
		EXPECT_EQ(e.GetExpected(), 11u);
	}
}

TEST(Writer, EntropyFailure)
{
	RecordingTransport transport;
	ShortEntropySource entropy{4};
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	/* unchunked records don't need a message id */
	EXPECT_NO_THROW(writer.Write(AsBytes("hello world"sv)));

	EXPECT_THROW(writer.Write(MakePayload(2 * capacity)), Gelf::EntropyError);
	EXPECT_EQ(transport.size(), 1u);
}

TEST(Writer, Zlib)
{
	RecordingTransport transport;
	CountingEntropySource entropy;

	auto config = MakeConfig(Gelf::Compression::ZLIB);
	config.compression_level = 5;
	Gelf::Writer writer{config, transport, entropy};

	const auto src = AsBytes("hello world"sv);
	EXPECT_GT(writer.Write(src), 0u);

	const auto datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 1u);
	EXPECT_EQ(ToStringView(Inflate(datagrams.front(), DeflateFormat::ZLIB)),
		  "hello world"sv);
}

TEST(Writer, EncodingFailure)
{
	RecordingTransport transport;
	CountingEntropySource entropy;

	/* level 10 does not exist; deflateInit2() fails */
	Gelf::Writer writer{
		MakeConfig(Gelf::Compression::NONE),
		std::make_unique<Gelf::DeflateCompressor>(DeflateFormat::GZIP, 10),
		transport, entropy,
	};

	EXPECT_THROW(writer.Write(MakePayload(5000)), Gelf::EncodingError);
	EXPECT_EQ(transport.size(), 0u);
}

TEST(Writer, InvalidConfig)
{
	RecordingTransport transport;
	CountingEntropySource entropy;

	auto config = MakeConfig(Gelf::Compression::GZIP);
	config.compression_level = 42;
	EXPECT_THROW(Gelf::Writer(config, transport, entropy),
		     std::invalid_argument);

	config = MakeConfig(Gelf::Compression::NONE);
	config.chunk_size = Gelf::CHUNK_HEADER_SIZE;
	EXPECT_THROW(Gelf::Writer(config, transport, entropy),
		     std::invalid_argument);
}

TEST(Writer, SmallChunkSize)
{
	RecordingTransport transport;
	CountingEntropySource entropy;

	auto config = MakeConfig(Gelf::Compression::NONE);
	config.chunk_size = Gelf::CHUNK_HEADER_SIZE + 1;
	Gelf::Writer writer{config, transport, entropy};

	const auto payload = MakePayload(100);
	EXPECT_EQ(writer.Write(payload), payload.size());

	const auto datagrams = transport.GetDatagrams();
	ASSERT_EQ(datagrams.size(), 100u);
	EXPECT_EQ(Reassemble(datagrams), payload);
}

TEST(Writer, Concurrent)
{
	RecordingTransport transport;
	Gelf::UrandomEntropySource entropy;
	Gelf::Writer writer{MakeConfig(Gelf::Compression::NONE), transport, entropy};

	static constexpr unsigned n_threads = 4, n_records = 50;
	const auto payload = MakePayload(4 * capacity + 17);

	std::vector<std::thread> threads;
	for (unsigned i = 0; i < n_threads; ++i)
		threads.emplace_back([&writer, &payload]{
			for (unsigned j = 0; j < n_records; ++j)
				writer.Write(payload);
		});

	for (auto &i : threads)
		i.join();

	/* group the chunks by message id; chunks of different records
	   may be interleaved, but each record must be complete */
	std::map<Gelf::MessageId, std::vector<std::byte>> records;
	for (const auto &d : transport.GetDatagrams()) {
		const auto chunk = Gelf::ParseChunk(d);
		EXPECT_EQ(chunk.header.count, 5);

		auto &r = records[chunk.header.message_id];
		EXPECT_EQ(r.size(), chunk.header.sequence * capacity);
		r.insert(r.end(), chunk.payload.begin(), chunk.payload.end());
	}

	EXPECT_EQ(records.size(), n_threads * n_records);
	for (const auto &[id, r] : records)
		EXPECT_EQ(r, payload);
}
