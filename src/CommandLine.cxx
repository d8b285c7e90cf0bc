// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandLine.hxx"
#include "config/File.hxx"
#include "config/Parser.hxx"
#include "util/OptionDef.hxx"
#include "util/OptionParser.hxx"

#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>

#ifdef HAVE_AVAHI
static constexpr bool have_avahi = true;
#else
static constexpr bool have_avahi = false;
#endif

enum Option {
	OPTION_CONFIG,
	OPTION_DISCOVER_ONLY,
	OPTION_DEVICE,
	OPTION_TIMEOUT,
	OPTION_CONCURRENCY,
	OPTION_VERBOSE,
	OPTION_VERSION,
	OPTION_HELP,
};

static constexpr OptionDef option_defs[] = {
	{"config", 'c', "FILE", "load this configuration file"},
	{"discover-only", 'd', "only discover devices, don't play anything"},
	{"device", 0, "IP:PORT", "skip discovery and blast just this device"},
	{"timeout", 't', "MS", "discovery timeout in milliseconds"},
	{"concurrency", 'j', "N", "number of devices controlled in parallel"},
	{"verbose", 'v', "verbose logging"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
};

[[noreturn]]
static void version() noexcept
{
	printf("blaster " BLASTER_VERSION "\n"
	       "\n"
	       "Discovery methods:\n"
	       " ssdp%s port_scan\n",
	       have_avahi ? " mdns" : "");

	exit(EXIT_SUCCESS);
}

static void PrintOption(const OptionDef &opt) noexcept
{
	const char *name = opt.GetLongOption();
	char buffer[32];
	if (opt.HasValue())
		snprintf(buffer, sizeof(buffer), "%s %s",
			 name, opt.GetValueName());
	else
		snprintf(buffer, sizeof(buffer), "%s", name);

	if (opt.HasShortOption())
		printf("  -%c, --%-18s%s\n",
		       opt.GetShortOption(), buffer,
		       opt.GetDescription());
	else
		printf("      --%-18s%s\n",
		       buffer, opt.GetDescription());
}

[[noreturn]]
static void help() noexcept
{
	printf("Usage:\n"
	       "  blaster [OPTION...] [MEDIA_URL]\n"
	       "\n"
	       "Discover media renderers on the local network and make\n"
	       "all of them play a clip.\n"
	       "\n"
	       "Options:\n");

	for (const auto &i : option_defs)
		PrintOption(i);

	exit(EXIT_SUCCESS);
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config)
{
	const char *config_file = nullptr;

	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_CONFIG:
			config_file = o.value;
			break;

		case OPTION_DISCOVER_ONLY:
			options.discover_only = true;
			break;

		case OPTION_DEVICE:
			options.device = o.value;
			break;

		case OPTION_TIMEOUT:
			options.discovery_timeout = ParseDuration(o.value);
			break;

		case OPTION_CONCURRENCY:
			options.concurrency = ParsePositive(o.value);
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
			help();
		}
	}

	for (const char *i : parser.GetRemaining()) {
		if (options.media_url != nullptr)
			throw std::runtime_error("Too many arguments");

		options.media_url = i;
	}

	if (options.discover_only && options.device != nullptr)
		throw std::runtime_error("--discover-only and --device are mutually exclusive");

	if (config_file != nullptr)
		ReadConfigFile(config, config_file);
}
