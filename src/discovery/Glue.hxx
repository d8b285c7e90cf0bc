// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Factory.hxx"
#include "Config.hxx"

class EventLoop;
class CurlGlobal;

/**
 * Creates the SSDP, mDNS and port scan discoverers enabled in the
 * #DiscoveryConfig.
 */
class DefaultDiscovererFactory final : public DiscovererFactory {
	EventLoop &event_loop;
	CurlGlobal &curl;
	const DiscoveryConfig &config;

public:
	DefaultDiscovererFactory(EventLoop &_event_loop, CurlGlobal &_curl,
				 const DiscoveryConfig &_config) noexcept
		:event_loop(_event_loop), curl(_curl), config(_config) {}

	std::vector<std::unique_ptr<Discoverer>>
	CreateDiscoverers(DiscoveryListener &listener) override;
};
