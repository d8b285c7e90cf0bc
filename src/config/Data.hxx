// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Option.hxx"
#include "Param.hxx"
#include "Block.hxx"

#include <array>
#include <chrono>
#include <cstddef>
#include <forward_list>

struct ConfigData {
	std::array<std::forward_list<ConfigParam>, std::size_t(ConfigOption::MAX)> params;
	std::array<std::forward_list<ConfigBlock>, std::size_t(ConfigBlockOption::MAX)> blocks;

	void Clear();

	auto &GetParamList(ConfigOption option) noexcept {
		return params[size_t(option)];
	}

	const auto &GetParamList(ConfigOption option) const noexcept {
		return params[size_t(option)];
	}

	void AddParam(ConfigOption option, ConfigParam &&param) noexcept;

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &list = GetParamList(option);
		return list.empty() ? nullptr : &list.front();
	}

	template<typename F>
	auto With(ConfigOption option, F &&f) const {
		const auto *param = GetParam(option);
		return param != nullptr
			? param->With(std::forward<F>(f))
			: f(nullptr);
	}

	[[gnu::pure]]
	const char *GetString(ConfigOption option,
			      const char *default_value=nullptr) const noexcept;

	unsigned GetUnsigned(ConfigOption option,
			     unsigned default_value) const;

	unsigned GetPositive(ConfigOption option,
			     unsigned default_value) const;

	std::chrono::milliseconds
	GetDuration(ConfigOption option,
		    std::chrono::milliseconds default_value) const;

	bool GetBool(ConfigOption option, bool default_value) const;

	auto &GetBlockList(ConfigBlockOption option) noexcept {
		return blocks[size_t(option)];
	}

	const auto &GetBlockList(ConfigBlockOption option) const noexcept {
		return blocks[size_t(option)];
	}

	ConfigBlock &AddBlock(ConfigBlockOption option,
			      ConfigBlock &&block) noexcept;

	[[gnu::pure]]
	const ConfigBlock *GetBlock(ConfigBlockOption option) const noexcept {
		const auto &list = GetBlockList(option);
		return list.empty() ? nullptr : &list.front();
	}
};
