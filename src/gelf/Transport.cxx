// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Transport.hxx"
#include "Protocol.hxx"
#include "Error.hxx"
#include "net/RConnectSocket.hxx"
#include "net/SendMessage.hxx"
#include "io/Iovec.hxx"

#include <fmt/core.h>

#include <exception>

#include <sys/socket.h>

using std::string_view_literals::operator""sv;

namespace Gelf {

std::size_t
Transport::Send(std::span<const struct iovec> v)
{
	const std::size_t expected = GetTotalSize(v);
	const std::size_t nbytes = SendDatagram(v);
	if (nbytes != expected)
		throw PartialSendError{nbytes, expected};

	return nbytes;
}

UdpTransport::UdpTransport(const char *address,
			   std::chrono::milliseconds timeout)
try
	:fd(ResolveConnectDatagramSocket(address, DEFAULT_PORT, timeout))
{
} catch (...) {
	std::throw_with_nested(TransportUnavailableError{fmt::format("Failed to connect to GELF server '{}'"sv,
								     address)});
}

std::size_t
UdpTransport::SendDatagram(std::span<const struct iovec> v)
{
	return SendMessage(fd, v, MSG_DONTWAIT);
}

} // namespace Gelf
