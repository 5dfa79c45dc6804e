// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Format.hxx"

#include <cstddef>
#include <span>
#include <vector>

/**
 * Compress the given buffer in one go and return the complete
 * compressed stream (including header and trailer of the given
 * format).
 *
 * Throws #ZlibError on error (e.g. if the compression level is
 * invalid).
 *
 * @param level the zlib compression level (-1 for the default,
 * 0..9)
 */
std::vector<std::byte>
Deflate(std::span<const std::byte> src, DeflateFormat format, int level);
