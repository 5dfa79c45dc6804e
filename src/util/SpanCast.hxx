// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Cast a std::string_view to a std::span<const std::byte>.
 */
inline std::span<const std::byte>
AsBytes(std::string_view sv) noexcept
{
	return std::as_bytes(std::span{sv});
}

/**
 * Cast a std::span<const std::byte> to a std::string_view.
 */
inline std::string_view
ToStringView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}
