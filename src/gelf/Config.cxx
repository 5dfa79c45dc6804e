// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

namespace Gelf {

static constexpr int MIN_COMPRESSION_LEVEL = -1;
static constexpr int MAX_COMPRESSION_LEVEL = 9;

static constexpr bool
IsValidChunkSize(std::size_t chunk_size) noexcept
{
	return chunk_size > CHUNK_HEADER_SIZE && chunk_size <= MAX_CHUNK_SIZE;
}

void
Config::Check() const
{
	if (!IsValidChunkSize(chunk_size))
		throw std::invalid_argument{fmt::format("Chunk size {} is out of range ({}..{})"sv,
							chunk_size,
							CHUNK_HEADER_SIZE + 1,
							MAX_CHUNK_SIZE)};

	if (compression != Compression::NONE &&
	    (compression_level < MIN_COMPRESSION_LEVEL ||
	     compression_level > MAX_COMPRESSION_LEVEL))
		throw std::invalid_argument{fmt::format("Compression level {} is out of range"sv,
							compression_level)};
}

Compression
ParseCompression(std::string_view s)
{
	if (s == "none"sv)
		return Compression::NONE;
	else if (s == "gzip"sv)
		return Compression::GZIP;
	else if (s == "zlib"sv)
		return Compression::ZLIB;
	else
		throw std::invalid_argument{fmt::format("Unknown compression: '{}'"sv, s)};
}

std::string_view
ToString(Compression compression) noexcept
{
	switch (compression) {
	case Compression::NONE:
		return "none"sv;

	case Compression::GZIP:
		return "gzip"sv;

	case Compression::ZLIB:
		return "zlib"sv;
	}

	return {};
}

int
ParseCompressionLevel(const char *s)
{
	char *endptr;
	const long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0 ||
	    value < MIN_COMPRESSION_LEVEL || value > MAX_COMPRESSION_LEVEL)
		throw std::invalid_argument{fmt::format("Invalid compression level: '{}'"sv, s)};

	return static_cast<int>(value);
}

std::size_t
ParseChunkSize(const char *s)
{
	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-' ||
	    !IsValidChunkSize(value))
		throw std::invalid_argument{fmt::format("Invalid chunk size: '{}'"sv, s)};

	return value;
}

} // namespace Gelf
