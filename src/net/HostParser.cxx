// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <mk@cm4all.com>

#include "HostParser.hxx"

#include <string.h>

static constexpr bool
IsValidHostnameChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') ||
		(ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') ||
		ch == '-' || ch == '.' || ch == '_';
}

static constexpr bool
IsValidIPv6Char(char ch) noexcept
{
	return (ch >= '0' && ch <= '9') ||
		(ch >= 'a' && ch <= 'f') ||
		(ch >= 'A' && ch <= 'F') ||
		ch == ':';
}

static const char *
FindIPv6End(const char *p) noexcept
{
	while (IsValidIPv6Char(*p))
		++p;
	return p;
}

ExtractHostResult
ExtractHost(const char *src) noexcept
{
	ExtractHostResult result{{}, src};

	if (IsValidHostnameChar(*src)) {
		const char *const hostname = src++;
		const char *colon = nullptr;

		while (IsValidHostnameChar(*src) || *src == ':') {
			if (*src == ':') {
				if (colon != nullptr) {
					/* second colon: an IPv6 address
					   without brackets (and without
					   port) */
					result.end = FindIPv6End(src + 1);
					result.host = {hostname, result.end};
					return result;
				}

				colon = src;
			}

			++src;
		}

		result.end = colon != nullptr ? colon : src;
		result.host = {hostname, result.end};
	} else if (src[0] == ':' && src[1] == ':') {
		/* IPv6 address beginning with "::" */
		result.end = FindIPv6End(src + 2);
		result.host = {src, result.end};
	} else if (src[0] == '[') {
		/* "[IPv6]:port" */
		const char *const hostname = src + 1;
		const char *end = strchr(hostname, ']');
		if (end == nullptr || end == hostname)
			return result;

		result.host = {hostname, end};
		result.end = end + 1;
	}

	return result;
}
