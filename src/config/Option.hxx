// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

enum class ConfigOption {
	MEDIA_URL,
	LOG_LEVEL,
	LOG_TIMESTAMP,
	CONCURRENCY,
	DISCOVERY_TIMEOUT,
	CONTROL_TIMEOUT,
	SETTLE_DELAY,
	CONTROL_PROBE,
	PRESET,
	GENERIC_NAME_PATTERN,
	MAX
};

enum class ConfigBlockOption {
	SSDP,
	MDNS,
	PORT_SCAN,
	MAX
};

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
enum ConfigOption
ParseConfigOptionName(const char *name) noexcept;

/**
 * @return #ConfigBlockOption::MAX if not found
 */
[[gnu::pure]]
enum ConfigBlockOption
ParseConfigBlockOptionName(const char *name) noexcept;
