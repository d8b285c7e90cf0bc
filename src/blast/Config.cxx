// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Config.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"

BlastConfig
LoadBlastConfig(const ConfigData &config)
{
	BlastConfig bc;

	if (const char *url = config.GetString(ConfigOption::MEDIA_URL))
		bc.media_url = url;

	bc.concurrency = config.GetPositive(ConfigOption::CONCURRENCY,
					    bc.concurrency);

	bc.discovery = LoadDiscoveryConfig(config);

	bc.control.timeout = config.GetDuration(ConfigOption::CONTROL_TIMEOUT,
						bc.control.timeout);
	bc.control.settle_delay = config.GetDuration(ConfigOption::SETTLE_DELAY,
						     bc.control.settle_delay);
	bc.control.probe = config.GetBool(ConfigOption::CONTROL_PROBE,
					  bc.control.probe);

	return bc;
}
