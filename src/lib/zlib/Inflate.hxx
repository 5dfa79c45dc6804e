// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Format.hxx"

#include <cstddef>
#include <span>
#include <vector>

/**
 * Decompress a complete deflate stream of the given format.
 *
 * Throws #ZlibError on error, e.g. if the header does not match the
 * format or if the stream is truncated.
 */
std::vector<std::byte>
Inflate(std::span<const std::byte> src, DeflateFormat format);
