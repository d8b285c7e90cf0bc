// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "device/Method.hxx"

class DiscoveryListener;

/**
 * An object which searches the local network for renderers using
 * one protocol.  It reports to a #DiscoveryListener.  All methods
 * must be called in the #EventLoop thread.
 *
 * Deleting the object cancels all pending work, including
 * enrichment that was started before Stop().
 */
class Discoverer {
protected:
	DiscoveryListener &listener;

	explicit Discoverer(DiscoveryListener &_listener) noexcept
		:listener(_listener) {}

public:
	/**
	 * Free instance data.
	 */
	virtual ~Discoverer() noexcept = default;

	Discoverer(const Discoverer &) = delete;
	Discoverer &operator=(const Discoverer &) = delete;

	virtual DiscoveryMethod GetMethod() const noexcept = 0;

	/**
	 * Start searching.
	 *
	 * Throws on error (e.g. if a socket cannot be created); in
	 * that case, the object is unusable, but sibling discoverers
	 * are not affected.
	 */
	virtual void Start() = 0;

	/**
	 * Stop searching.  Asynchronous enrichment of devices which
	 * were already reported may continue and may be delivered
	 * through DiscoveryListener::OnDeviceUpdate().
	 */
	virtual void Stop() noexcept = 0;
};
