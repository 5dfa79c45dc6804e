// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstdint>

/**
 * The container format wrapped around a deflate stream.
 */
enum class DeflateFormat : uint_least8_t {
	/**
	 * RFC 1950 ("zlib") header and Adler-32 trailer.
	 */
	ZLIB,

	/**
	 * RFC 1952 ("gzip") header and CRC-32 trailer.
	 */
	GZIP,
};

/**
 * Convert a #DeflateFormat to the "windowBits" parameter of
 * deflateInit2() and inflateInit2().
 */
constexpr int
ToWindowBits(DeflateFormat format) noexcept
{
	constexpr int max_wbits = 15; // MAX_WBITS

	switch (format) {
	case DeflateFormat::ZLIB:
		break;

	case DeflateFormat::GZIP:
		/* adding 16 selects the gzip wrapper */
		return max_wbits + 16;
	}

	return max_wbits;
}
