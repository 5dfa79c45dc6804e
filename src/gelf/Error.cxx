// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

namespace Gelf {

TooManyChunksError::TooManyChunksError(std::size_t _count,
				       std::size_t _max) noexcept
	:Error(fmt::format("Need {} chunks, but the maximum is {}"sv,
			   _count, _max)),
	 count(_count), max(_max) {}

PartialSendError::PartialSendError(std::size_t _sent,
				   std::size_t _expected) noexcept
	:Error(fmt::format("Sent {} of {} bytes"sv, _sent, _expected)),
	 sent(_sent), expected(_expected) {}

} // namespace Gelf
