// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <stdexcept>

namespace Gelf {

/**
 * Base class for all errors thrown by the GELF sink.  The underlying
 * cause (e.g. a std::system_error) is usually attached with
 * std::throw_with_nested().
 */
class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The compressor could not be initialized or has failed.
 */
class EncodingError : public Error {
public:
	using Error::Error;
};

/**
 * Not enough random bytes could be obtained for a message id.
 */
class EntropyError : public Error {
public:
	using Error::Error;
};

/**
 * The record is too large even after compression.  Thrown before
 * any datagram is sent.
 */
class TooManyChunksError : public Error {
	std::size_t count, max;

public:
	TooManyChunksError(std::size_t _count, std::size_t _max) noexcept;

	std::size_t GetCount() const noexcept {
		return count;
	}

	std::size_t GetMax() const noexcept {
		return max;
	}
};

/**
 * Fewer bytes than submitted were sent.  If this is thrown by
 * Writer::Write(), GetSent() is the number of payload bytes which
 * have already been handed to the transport.
 */
class PartialSendError : public Error {
	std::size_t sent, expected;

public:
	PartialSendError(std::size_t _sent, std::size_t _expected) noexcept;

	std::size_t GetSent() const noexcept {
		return sent;
	}

	std::size_t GetExpected() const noexcept {
		return expected;
	}
};

/**
 * The transport could not be set up (address could not be resolved
 * or the socket could not be connected).
 */
class TransportUnavailableError : public Error {
public:
	using Error::Error;
};

/**
 * A malformed chunk was received.
 */
class ProtocolError : public Error {
public:
	using Error::Error;
};

} // namespace Gelf
