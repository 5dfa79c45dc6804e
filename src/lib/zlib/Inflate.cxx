// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Inflate.hxx"
#include "Error.hxx"

#include <zlib.h>

namespace {

class InflateStream {
	z_stream z{};

public:
	explicit InflateStream(DeflateFormat format) {
		int result = inflateInit2(&z, ToWindowBits(format));
		if (result != Z_OK)
			throw ZlibError{result};
	}

	~InflateStream() noexcept {
		inflateEnd(&z);
	}

	InflateStream(const InflateStream &) = delete;
	InflateStream &operator=(const InflateStream &) = delete;

	void Run(std::span<const std::byte> src, std::vector<std::byte> &dest);
};

void
InflateStream::Run(std::span<const std::byte> src,
		   std::vector<std::byte> &dest)
{
	z.next_in = reinterpret_cast<Bytef *>(const_cast<std::byte *>(src.data()));
	z.avail_in = static_cast<uInt>(src.size());

	while (true) {
		const std::size_t fill = dest.size();
		dest.resize(fill + 16384);

		z.next_out = reinterpret_cast<Bytef *>(dest.data() + fill);
		z.avail_out = 16384;

		int result = inflate(&z, Z_NO_FLUSH);
		dest.resize(fill + 16384 - z.avail_out);

		if (result == Z_STREAM_END)
			break;

		if (result == Z_BUF_ERROR && z.avail_in == 0)
			/* premature end of input */
			throw ZlibError{Z_DATA_ERROR};

		if (result != Z_OK && result != Z_BUF_ERROR)
			throw ZlibError{result};
	}
}

} // anonymous namespace

std::vector<std::byte>
Inflate(std::span<const std::byte> src, DeflateFormat format)
{
	InflateStream stream{format};

	std::vector<std::byte> dest;
	stream.Run(src, dest);
	return dest;
}
