// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MessageId.hxx"
#include "EntropySource.hxx"
#include "Error.hxx"

#include <fmt/core.h>

#include <exception>

using std::string_view_literals::operator""sv;

namespace Gelf {

MessageId
MessageIdGenerator::Next() const
{
	MessageId id;

	std::size_t nbytes;
	try {
		nbytes = source.Read(id);
	} catch (...) {
		std::throw_with_nested(EntropyError{"Failed to generate message id"});
	}

	if (nbytes != id.size())
		throw EntropyError{fmt::format("Short read from random source: {} of {} bytes"sv,
					       nbytes, id.size())};

	return id;
}

} // namespace Gelf
