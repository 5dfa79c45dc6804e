// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <memory>

namespace Gelf {

struct Config;
class Sink;

/**
 * Create the #Sink for the given #Config: a #UdpClient if an address
 * is configured, else a #ConsoleSink.  If the GELF server cannot be
 * dialed, the error is logged and the #ConsoleSink is returned, so
 * logging never prevents the application from starting.
 *
 * Throws std::invalid_argument if the #Config is invalid.
 */
std::unique_ptr<Sink>
OpenSink(const Config &config);

} // namespace Gelf
