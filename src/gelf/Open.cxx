// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Open.hxx"
#include "Client.hxx"
#include "Config.hxx"
#include "ConsoleSink.hxx"
#include "Error.hxx"
#include "io/Logger.hxx"

namespace Gelf {

static const LLogger logger{"gelf"};

std::unique_ptr<Sink>
OpenSink(const Config &config)
{
	config.Check();

	if (config.address.empty())
		return std::make_unique<ConsoleSink>();

	try {
		auto client = std::make_unique<UdpClient>(config);
		logger.Fmt(3, "sending to {} ({} compression, chunk size {})",
			   config.address, ToString(config.compression),
			   config.chunk_size);
		return client;
	} catch (const TransportUnavailableError &) {
		logger(1, "could not connect with graylog, falling back to stdout: ",
		       std::current_exception());
		return std::make_unique<ConsoleSink>();
	}
}

} // namespace Gelf
