// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Deflate.hxx"
#include "Error.hxx"

#include <zlib.h>

#include <algorithm> // for std::min()
#include <limits>

namespace {

class DeflateStream {
	z_stream z{};

public:
	DeflateStream(DeflateFormat format, int level) {
		int result = deflateInit2(&z, level, Z_DEFLATED,
					  ToWindowBits(format), 8,
					  Z_DEFAULT_STRATEGY);
		if (result != Z_OK)
			throw ZlibError{result};
	}

	~DeflateStream() noexcept {
		deflateEnd(&z);
	}

	DeflateStream(const DeflateStream &) = delete;
	DeflateStream &operator=(const DeflateStream &) = delete;

	std::size_t Bound(std::size_t src_size) noexcept {
		return deflateBound(&z, src_size);
	}

	/**
	 * Feed all of #src into the stream and finish it, appending
	 * everything to #dest.
	 */
	void Finish(std::span<const std::byte> src, std::vector<std::byte> &dest);
};

void
DeflateStream::Finish(std::span<const std::byte> src,
		      std::vector<std::byte> &dest)
{
	/* "avail_in" is only an "unsigned int"; larger inputs are
	   fed in several steps */
	constexpr std::size_t max_avail = std::numeric_limits<uInt>::max();

	z.next_in = reinterpret_cast<Bytef *>(const_cast<std::byte *>(src.data()));

	std::size_t remaining = src.size();

	while (true) {
		const std::size_t n_in = std::min(remaining, max_avail);
		z.avail_in = static_cast<uInt>(n_in);
		remaining -= n_in;

		const int flush = remaining > 0 ? Z_NO_FLUSH : Z_FINISH;

		do {
			if (dest.size() == dest.capacity())
				dest.reserve(dest.capacity() * 2 + 64);

			const std::size_t fill = dest.size();
			const std::size_t space = std::min(dest.capacity() - fill,
							   max_avail);
			dest.resize(fill + space);

			z.next_out = reinterpret_cast<Bytef *>(dest.data() + fill);
			z.avail_out = static_cast<uInt>(space);

			int result = deflate(&z, flush);
			dest.resize(fill + space - z.avail_out);

			if (result == Z_STREAM_END)
				return;

			if (result != Z_OK && result != Z_BUF_ERROR)
				throw ZlibError{result};
		} while (z.avail_in > 0 || (flush == Z_FINISH));

		/* avail_in == 0 and more input is pending */
	}
}

} // anonymous namespace

std::vector<std::byte>
Deflate(std::span<const std::byte> src, DeflateFormat format, int level)
{
	DeflateStream stream{format, level};

	std::vector<std::byte> dest;
	dest.reserve(stream.Bound(src.size()));

	stream.Finish(src, dest);
	return dest;
}
