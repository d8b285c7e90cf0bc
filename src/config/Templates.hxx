// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

struct ConfigTemplate {
	const char *const name;
	const bool repeatable;

	constexpr ConfigTemplate(const char *_name,
				 bool _repeatable=false) noexcept
		:name(_name), repeatable(_repeatable) {}
};

extern const ConfigTemplate config_param_templates[];
extern const ConfigTemplate config_block_templates[];
