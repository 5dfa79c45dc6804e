// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "lib/zlib/Deflate.hxx"
#include "lib/zlib/Inflate.hxx"
#include "lib/zlib/Error.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <zlib.h>

using std::string_view_literals::operator""sv;

static constexpr auto lorem = "Lorem ipsum dolor sit amet, consectetur adipiscing elit, "
	"sed do eiusmod tempor incididunt ut labore et dolore magna aliqua."sv;

TEST(Deflate, Gzip)
{
	const auto compressed = Deflate(AsBytes(lorem), DeflateFormat::GZIP, 6);
	ASSERT_GE(compressed.size(), 18u);
	EXPECT_EQ(compressed[0], std::byte{0x1f});
	EXPECT_EQ(compressed[1], std::byte{0x8b});

	EXPECT_EQ(ToStringView(Inflate(compressed, DeflateFormat::GZIP)), lorem);
}

TEST(Deflate, Zlib)
{
	const auto compressed = Deflate(AsBytes(lorem), DeflateFormat::ZLIB, Z_DEFAULT_COMPRESSION);
	ASSERT_GE(compressed.size(), 6u);
	EXPECT_EQ(compressed[0], std::byte{0x78});

	EXPECT_EQ(ToStringView(Inflate(compressed, DeflateFormat::ZLIB)), lorem);
}

TEST(Deflate, Large)
{
	/* larger than the initial output buffer */
	std::vector<std::byte> src(1 << 20);
	for (std::size_t i = 0; i < src.size(); ++i)
		src[i] = static_cast<std::byte>((i * 7919) ^ (i >> 11));

	const auto compressed = Deflate(src, DeflateFormat::GZIP, 1);
	EXPECT_EQ(Inflate(compressed, DeflateFormat::GZIP), src);
}

TEST(Deflate, InvalidLevel)
{
	try {
		Deflate(AsBytes(lorem), DeflateFormat::GZIP, 42);
		FAIL();
	} catch (const ZlibError &e) {
		EXPECT_EQ(e.GetCode(), Z_STREAM_ERROR);
	}
}

TEST(Inflate, Truncated)
{
	auto compressed = Deflate(AsBytes(lorem), DeflateFormat::GZIP, 9);
	compressed.resize(compressed.size() / 2);

	EXPECT_THROW(Inflate(compressed, DeflateFormat::GZIP), ZlibError);
}

TEST(Inflate, WrongFormat)
{
	const auto compressed = Deflate(AsBytes(lorem), DeflateFormat::ZLIB, 9);
	EXPECT_THROW(Inflate(compressed, DeflateFormat::GZIP), ZlibError);
}
