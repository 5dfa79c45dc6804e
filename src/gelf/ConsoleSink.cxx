// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConsoleSink.hxx"
#include "Error.hxx"
#include "io/Iovec.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/SpanCast.hxx"

#include <array>

#include <sys/uio.h>

using std::string_view_literals::operator""sv;

namespace Gelf {

std::size_t
ConsoleSink::Write(std::span<const std::byte> src)
{
	/* records from the frontend may already end with a newline */
	const bool has_newline = !src.empty() && src.back() == std::byte{'\n'};

	const std::array v{
		MakeIovec(src),
		MakeIovec(AsBytes(has_newline ? ""sv : "\n"sv)),
	};

	ssize_t nbytes = writev(fd, v.data(), v.size());
	if (nbytes < 0)
		throw FmtErrno("Failed to write log record to fd {}", fd);

	if (const std::size_t expected = GetTotalSize(v);
	    static_cast<std::size_t>(nbytes) != expected)
		throw PartialSendError{static_cast<std::size_t>(nbytes), expected};

	return src.size();
}

} // namespace Gelf
