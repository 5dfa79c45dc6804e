// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketDescriptor.hxx"
#include "SocketAddress.hxx"

#include <utility> // for std::exchange

#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

void
SocketDescriptor::Close() noexcept
{
	if (IsDefined())
		close(std::exchange(fd, -1));
}

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
	type |= SOCK_CLOEXEC;

	int new_fd = socket(domain, type, protocol);
	if (new_fd < 0)
		return false;

	Set(new_fd);
	return true;
}

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
	return Create(domain, type | SOCK_NONBLOCK, protocol);
}

int
SocketDescriptor::GetError() const noexcept
{
	int s_err = 0;
	socklen_t s_err_size = sizeof(s_err);
	return getsockopt(fd, SOL_SOCKET, SO_ERROR,
			  (char *)&s_err, &s_err_size) == 0
		? s_err
		: errno;
}

bool
SocketDescriptor::Connect(SocketAddress address) const noexcept
{
	return connect(Get(), address.GetAddress(), address.GetSize()) >= 0;
}

int
SocketDescriptor::WaitWritable(int timeout_ms) const noexcept
{
	struct pollfd pfd{
		.fd = fd,
		.events = POLLOUT,
		.revents = 0,
	};

	int result;
	do {
		result = poll(&pfd, 1, timeout_ms);
	} while (result < 0 && errno == EINTR);

	return result;
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest, int flags) const noexcept
{
	return recv(Get(), dest.data(), dest.size(), flags);
}

ssize_t
SocketDescriptor::Send(const struct msghdr &msg, int flags) const noexcept
{
	flags |= MSG_NOSIGNAL;

	return sendmsg(Get(), &msg, flags);
}
