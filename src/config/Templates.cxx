// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Templates.hxx"
#include "Option.hxx"

#include <iterator>

#include <string.h>

const ConfigTemplate config_param_templates[] = {
	{ "media_url" },
	{ "log_level" },
	{ "log_timestamp" },
	{ "concurrency" },
	{ "discovery_timeout" },
	{ "control_timeout" },
	{ "settle_delay" },
	{ "control_probe" },
	{ "preset" },
	{ "generic_name_pattern", true },
};

static constexpr unsigned n_config_param_templates =
	std::size(config_param_templates);

static_assert(n_config_param_templates == unsigned(ConfigOption::MAX),
	      "Wrong number of config_param_templates");

const ConfigTemplate config_block_templates[] = {
	{ "ssdp" },
	{ "mdns" },
	{ "port_scan" },
};

static constexpr unsigned n_config_block_templates =
	std::size(config_block_templates);

static_assert(n_config_block_templates == unsigned(ConfigBlockOption::MAX),
	      "Wrong number of config_block_templates");

template<std::size_t n>
[[gnu::pure]]
static inline unsigned
ParseConfigTemplateName(const ConfigTemplate (&templates)[n],
			const char *name) noexcept
{
	unsigned i = 0;
	for (; i < n; ++i)
		if (strcmp(templates[i].name, name) == 0)
			break;

	return i;
}

ConfigOption
ParseConfigOptionName(const char *name) noexcept
{
	return ConfigOption(ParseConfigTemplateName(config_param_templates,
						    name));
}

ConfigBlockOption
ParseConfigBlockOptionName(const char *name) noexcept
{
	return ConfigBlockOption(ParseConfigTemplateName(config_block_templates,
							 name));
}
