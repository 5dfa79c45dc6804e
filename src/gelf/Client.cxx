// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Client.hxx"
#include "Config.hxx"

namespace Gelf {

UdpClient::UdpClient(const Config &config)
	:transport(config.address.c_str()),
	 writer(config, transport, entropy) {}

UdpClient::UdpClient(const Config &config, UniqueSocketDescriptor &&fd)
	:transport(std::move(fd)),
	 writer(config, transport, entropy) {}

} // namespace Gelf
