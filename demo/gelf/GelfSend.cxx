// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Read log records (one per line, usually GELF JSON) from stdin and
 * send them to a GELF server.
 */

#include "gelf/Config.hxx"
#include "gelf/Open.hxx"
#include "gelf/Sink.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"
#include "util/SpanCast.hxx"

#include <stdexcept>
#include <string_view>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static constexpr LLogger logger{"gelf-send"};

static void
Usage()
{
	fprintf(stderr, "usage: gelf-send [--compression=none|gzip|zlib] [--level=N]\n"
		"                 [--chunk-size=N] [--verbose] ADDRESS\n");
}

static const char *
SkipPrefix(const char *s, const char *prefix) noexcept
{
	const std::size_t length = strlen(prefix);
	return strncmp(s, prefix, length) == 0 ? s + length : nullptr;
}

static Gelf::Config
ParseCommandLine(int argc, char **argv)
{
	Gelf::Config config;

	int i = 1;
	for (; i < argc && argv[i][0] == '-'; ++i) {
		const char *arg = argv[i];

		if (const char *value = SkipPrefix(arg, "--compression="))
			config.compression = Gelf::ParseCompression(value);
		else if (const char *value = SkipPrefix(arg, "--level="))
			config.compression_level = Gelf::ParseCompressionLevel(value);
		else if (const char *value = SkipPrefix(arg, "--chunk-size="))
			config.chunk_size = Gelf::ParseChunkSize(value);
		else if (strcmp(arg, "--verbose") == 0)
			SetLogLevel(5);
		else
			throw std::invalid_argument{"Unknown option"};
	}

	if (i != argc - 1)
		throw std::invalid_argument{"Address expected"};

	config.address = argv[i];
	config.Check();
	return config;
}

int
main(int argc, char **argv) noexcept
try {
	Gelf::Config config;
	try {
		config = ParseCommandLine(argc, argv);
	} catch (const std::invalid_argument &e) {
		fprintf(stderr, "%s\n", e.what());
		Usage();
		return EXIT_FAILURE;
	}

	const auto sink = Gelf::OpenSink(config);

	unsigned n_errors = 0;

	char *line = nullptr;
	size_t line_size = 0;
	ssize_t length;
	while ((length = getline(&line, &line_size, stdin)) > 0) {
		std::string_view record{line, static_cast<std::size_t>(length)};
		if (record.ends_with('\n'))
			record.remove_suffix(1);

		if (record.empty())
			continue;

		try {
			const std::size_t nbytes = sink->Write(AsBytes(record));
			logger.Fmt(5, "sent record of {} bytes as {} bytes",
				   record.size(), nbytes);
		} catch (...) {
			/* this record is lost; continue with the next
			   one */
			PrintException(std::current_exception());
			++n_errors;
		}
	}

	free(line);

	return n_errors == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
