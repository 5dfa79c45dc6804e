// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

namespace Gelf {

/**
 * An abstract destination for serialized log records.  The logging
 * frontend writes each record with one Write() call.
 */
class Sink {
public:
	virtual ~Sink() noexcept = default;

	/**
	 * Write one record.  Throws on error; the record is then
	 * considered lost.
	 *
	 * @return the number of bytes written
	 */
	virtual std::size_t Write(std::span<const std::byte> src) = 0;
};

} // namespace Gelf
