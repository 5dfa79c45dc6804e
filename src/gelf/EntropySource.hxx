// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

namespace Gelf {

/**
 * A source of random bytes for message ids.
 */
class EntropySource {
public:
	virtual ~EntropySource() noexcept = default;

	/**
	 * Fill (part of) the given buffer with random data.  Throws on
	 * error.
	 *
	 * @return the number of bytes filled
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;
};

/**
 * Obtains cryptographically secure random bytes from the kernel
 * (getrandom()).  This class has no state and may be used from
 * multiple threads.
 */
class UrandomEntropySource final : public EntropySource {
public:
	std::size_t Read(std::span<std::byte> dest) override;
};

} // namespace Gelf
