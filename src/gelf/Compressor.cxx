// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Compressor.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "lib/zlib/Deflate.hxx"

#include <exception>

namespace Gelf {

std::vector<std::byte>
NullCompressor::Compress(std::span<const std::byte> src) const
{
	return {src.begin(), src.end()};
}

std::vector<std::byte>
DeflateCompressor::Compress(std::span<const std::byte> src) const
try {
	return Deflate(src, format, level);
} catch (...) {
	std::throw_with_nested(EncodingError{format == DeflateFormat::GZIP
					     ? "gzip compression failed"
					     : "zlib compression failed"});
}

std::unique_ptr<Compressor>
MakeCompressor(Compression compression, int level)
{
	switch (compression) {
	case Compression::NONE:
		break;

	case Compression::GZIP:
		return std::make_unique<DeflateCompressor>(DeflateFormat::GZIP,
							   level);

	case Compression::ZLIB:
		return std::make_unique<DeflateCompressor>(DeflateFormat::ZLIB,
							   level);
	}

	return std::make_unique<NullCompressor>();
}

} // namespace Gelf
