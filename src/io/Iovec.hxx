// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <numeric> // for std::accumulate()
#include <span>
#include <type_traits> // for std::has_unique_object_representations_v

#include <sys/uio.h>

constexpr struct iovec
MakeIovec(std::span<const std::byte> s) noexcept
{
	return { const_cast<std::byte *>(s.data()), s.size() };
}

template<typename T>
requires std::has_unique_object_representations_v<T>
constexpr struct iovec
MakeIovec(std::span<T> s) noexcept
{
	return MakeIovec(std::as_bytes(s));
}

template<typename T>
requires std::has_unique_object_representations_v<T>
constexpr struct iovec
MakeIovecT(T &t) noexcept
{
	return MakeIovec(std::span{&t, 1});
}

constexpr std::span<std::byte>
ToSpan(const struct iovec &i) noexcept
{
	return {static_cast<std::byte *>(i.iov_base), i.iov_len};
}

/**
 * Calculate the total number of bytes in the given #iovec list.
 */
[[gnu::pure]]
constexpr std::size_t
GetTotalSize(std::span<const struct iovec> v) noexcept
{
	return std::accumulate(v.begin(), v.end(), std::size_t{},
			       [](std::size_t size, const struct iovec &i){
				       return size + i.iov_len;
			       });
}
