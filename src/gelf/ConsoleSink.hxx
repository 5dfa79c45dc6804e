// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Sink.hxx"

#include <unistd.h>

namespace Gelf {

/**
 * Writes each record as one line to a file descriptor (usually
 * stdout).  This is the fallback if no GELF server is available.
 */
class ConsoleSink final : public Sink {
	const int fd;

public:
	explicit ConsoleSink(int _fd=STDOUT_FILENO) noexcept
		:fd(_fd) {}

	int GetFileDescriptor() const noexcept {
		return fd;
	}

	/**
	 * Throws std::system_error on error, #PartialSendError if
	 * the record was written only partially.
	 */
	std::size_t Write(std::span<const std::byte> src) override;
};

} // namespace Gelf
