// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Protocol.hxx"

namespace Gelf {

class EntropySource;

/**
 * Generates a fresh random #MessageId for each chunked record.
 * There is no check for collisions with earlier ids.
 */
class MessageIdGenerator {
	EntropySource &source;

public:
	explicit MessageIdGenerator(EntropySource &_source) noexcept
		:source(_source) {}

	/**
	 * Throws #EntropyError if the source fails or returns fewer
	 * than 8 bytes.  There is no retry.
	 */
	MessageId Next() const;
};

} // namespace Gelf
