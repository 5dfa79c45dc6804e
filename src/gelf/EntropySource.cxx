// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EntropySource.hxx"
#include "system/Error.hxx"

#include <sys/random.h>

namespace Gelf {

std::size_t
UrandomEntropySource::Read(std::span<std::byte> dest)
{
	ssize_t nbytes;
	do {
		nbytes = getrandom(dest.data(), dest.size(), 0);
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes < 0)
		throw MakeErrno("getrandom() failed");

	return nbytes;
}

} // namespace Gelf
