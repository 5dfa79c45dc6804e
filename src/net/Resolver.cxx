// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Resolver.hxx"
#include "AddressInfo.hxx"
#include "HostParser.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <netdb.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

using std::string_view_literals::operator""sv;

namespace {

/**
 * The state of one getaddrinfo_a() request.  The resolver thread
 * accesses it until the request is complete.
 */
struct Lookup {
	char host[256], port[16];

	struct addrinfo hints;

	struct gaicb request{};
};

} // anonymous namespace

static void
ParseHostAndPort(Lookup &lookup, const char *host_and_port, int default_port)
{
	const auto eh = ExtractHost(host_and_port);
	if (eh.HasFailed())
		throw std::runtime_error{fmt::format("Malformed host name: '{}'"sv,
						     host_and_port)};

	if (eh.host.size() >= sizeof(lookup.host))
		throw std::runtime_error{fmt::format("Host name too long: '{}'"sv,
						     host_and_port)};

	*std::copy(eh.host.begin(), eh.host.end(), lookup.host) = 0;

	const char *port = eh.end;
	if (*port == ':' && port[1] != 0 && strlen(port + 1) < sizeof(lookup.port)) {
		/* port specified */
		strcpy(lookup.port, port + 1);
	} else if (*port == 0) {
		/* no port specified */
		snprintf(lookup.port, sizeof(lookup.port), "%d", default_port);
	} else
		throw std::runtime_error{fmt::format("Garbage after host name: '{}'"sv,
						     host_and_port)};
}

/**
 * Wait for the completion of a getaddrinfo_a() request.
 *
 * @return false on timeout
 */
static bool
WaitLookup(struct gaicb &request, std::chrono::milliseconds timeout) noexcept
{
	using Clock = std::chrono::steady_clock;
	const auto deadline = Clock::now() + timeout;

	const struct gaicb *const list[]{&request};

	while (true) {
		const auto remaining = std::max<Clock::duration>(deadline - Clock::now(),
								 Clock::duration::zero());
		const auto s = std::chrono::floor<std::chrono::seconds>(remaining);
		const struct timespec ts{
			.tv_sec = static_cast<time_t>(s.count()),
			.tv_nsec = static_cast<long>(std::chrono::nanoseconds(remaining - s).count()),
		};

		const int result = gai_suspend(list, 1, &ts);
		if (result == EAI_INTR)
			continue;

		/* on EAI_AGAIN (timeout) the request may still have
		   completed in the meantime */
		return gai_error(&request) != EAI_INPROGRESS;
	}
}

AddressInfoList
Resolve(const char *host_and_port, int default_port,
	const struct addrinfo &hints,
	std::chrono::milliseconds timeout)
{
	auto lookup = std::make_unique<Lookup>();
	ParseHostAndPort(*lookup, host_and_port, default_port);

	lookup->hints = hints;
	lookup->request.ar_name = lookup->host;
	lookup->request.ar_service = lookup->port;
	lookup->request.ar_request = &lookup->hints;

	struct gaicb *list[]{&lookup->request};
	int result = getaddrinfo_a(GAI_NOWAIT, list, 1, nullptr);
	if (result != 0)
		throw std::runtime_error{fmt::format("Failed to resolve '{}': {}"sv,
						     host_and_port,
						     gai_strerror(result))};

	if (!WaitLookup(lookup->request, timeout)) {
		const int cancel_result = gai_cancel(&lookup->request);
		if (cancel_result != EAI_ALLDONE) {
			if (cancel_result == EAI_NOTCANCELED) {
				/* the resolver thread still owns the
				   request and will write to it; leak it */
				[[maybe_unused]] auto *leaked = lookup.release();
			}

			throw std::runtime_error{fmt::format("Timeout resolving '{}'"sv,
							     host_and_port)};
		}

		/* completed after all */
	}

	result = gai_error(&lookup->request);
	if (result != 0)
		throw std::runtime_error{fmt::format("Failed to resolve '{}': {}"sv,
						     host_and_port,
						     gai_strerror(result))};

	return AddressInfoList{lookup->request.ar_result};
}
