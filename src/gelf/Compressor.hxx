// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "lib/zlib/Format.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace Gelf {

enum class Compression : uint_least8_t;

/**
 * Compresses a whole record in memory.  Implementations must be
 * stateless so Compress() may be called from multiple threads.
 */
class Compressor {
public:
	virtual ~Compressor() noexcept = default;

	/**
	 * Throws #EncodingError on error.
	 */
	virtual std::vector<std::byte> Compress(std::span<const std::byte> src) const = 0;
};

/**
 * Passes the record through unmodified.
 */
class NullCompressor final : public Compressor {
public:
	std::vector<std::byte> Compress(std::span<const std::byte> src) const override;
};

/**
 * Compresses with zlib, wrapped in a gzip or zlib container.
 */
class DeflateCompressor final : public Compressor {
	const DeflateFormat format;
	const int level;

public:
	constexpr DeflateCompressor(DeflateFormat _format, int _level) noexcept
		:format(_format), level(_level) {}

	std::vector<std::byte> Compress(std::span<const std::byte> src) const override;
};

/**
 * Create the #Compressor implementation for the given algorithm.
 * The level is not checked here; an invalid level makes
 * Compress() throw #EncodingError.
 */
std::unique_ptr<Compressor>
MakeCompressor(Compression compression, int level);

} // namespace Gelf
