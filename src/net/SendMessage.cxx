// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SendMessage.hxx"
#include "SocketDescriptor.hxx"
#include "SocketError.hxx"

#include <sys/socket.h>

std::size_t
SendMessage(SocketDescriptor s, std::span<const struct iovec> v, int flags)
{
	struct msghdr mh{};
	mh.msg_iov = const_cast<struct iovec *>(v.data());
	mh.msg_iovlen = v.size();

	const auto nbytes = s.Send(mh, flags);
	if (nbytes < 0) {
		const auto e = GetSocketError();
		if (IsSocketErrorSendWouldBlock(e))
			throw MakeSocketError(e, "Socket buffer is full");

		throw MakeSocketError(e, "sendmsg() failed");
	}

	return static_cast<std::size_t>(nbytes);
}
