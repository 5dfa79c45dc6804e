// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <utility>

/*
 * Minimal stderr logger.  Each line is prefixed with the logger's
 * domain in square brackets; lines above the global level are
 * discarded.
 */

namespace LoggerDetail {

extern unsigned max_level;

[[gnu::pure]]
inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

/**
 * Write one line consisting of the given fragments.  Errors are
 * ignored.
 */
void
WriteV(std::string_view domain,
       std::span<const std::string_view> fragments) noexcept;

void
VFmt(unsigned level, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Convert a log parameter to a string_view.  Exceptions are
 * rendered with all nested exceptions; the std::string buffer owns
 * that text.
 */
inline std::string_view
ToFragment(std::string_view s, std::string &) noexcept
{
	return s;
}

std::string_view
ToFragment(std::exception_ptr ep, std::string &buffer) noexcept;

} // namespace LoggerDetail

/**
 * Only messages with a level less than or equal to the given value
 * are emitted.  The default is 1.
 */
inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

/**
 * A logger with a literal string as its domain.
 */
class LLogger {
	std::string_view domain;

public:
	constexpr explicit LLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	/**
	 * Concatenate all parameters (strings or a
	 * std::exception_ptr) to one line.
	 */
	template<typename... Params>
	requires(sizeof...(Params) > 0)
	void operator()(unsigned level, Params&&... params) const noexcept {
		if (!CheckLevel(level))
			return;

		std::string buffers[sizeof...(Params)];
		std::size_t i = 0;
		const std::string_view fragments[]{
			LoggerDetail::ToFragment(std::forward<Params>(params),
						 buffers[i++])...
		};

		LoggerDetail::WriteV(domain, fragments);
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::VFmt(level, domain, format_str,
				   fmt::make_format_args(args...));
	}
};
