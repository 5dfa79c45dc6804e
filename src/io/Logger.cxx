// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"
#include "Iovec.hxx"
#include "util/SpanCast.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <array>

#include <sys/uio.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

unsigned LoggerDetail::max_level = 1;

std::string_view
LoggerDetail::ToFragment(std::exception_ptr ep, std::string &buffer) noexcept
{
	buffer = GetFullMessage(std::move(ep));
	return buffer;
}

void
LoggerDetail::WriteV(std::string_view domain,
		     std::span<const std::string_view> fragments) noexcept
{
	std::array<struct iovec, 32> v;
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec(AsBytes("["sv));
		v[n++] = MakeIovec(AsBytes(domain));
		v[n++] = MakeIovec(AsBytes("] "sv));
	}

	for (const auto i : fragments) {
		/* reserve one slot for the newline */
		if (n + 1 >= v.size())
			break;

		v[n++] = MakeIovec(AsBytes(i));
	}

	v[n++] = MakeIovec(AsBytes("\n"sv));

	[[maybe_unused]] ssize_t nbytes = writev(STDERR_FILENO, v.data(), n);
}

void
LoggerDetail::VFmt(unsigned level, std::string_view domain,
		   fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);

	const std::string_view s[]{{buffer.data(), buffer.size()}};
	WriteV(domain, s);
}
