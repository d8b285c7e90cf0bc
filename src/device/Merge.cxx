// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Merge.hxx"
#include "Device.hxx"

#include <cassert>

bool
MergePolicy::IsGenericName(std::string_view name) const noexcept
{
	if (name.empty())
		return true;

	for (const auto &i : generic_patterns)
		if (name.find(i) != name.npos)
			return true;

	return false;
}

bool
MergePolicy::ShouldReplaceCore(const Device &existing,
			       const Device &incoming) const noexcept
{
	const unsigned old_precedence = GetPrecedence(existing.method);
	const unsigned new_precedence = GetPrecedence(incoming.method);

	if (new_precedence != old_precedence)
		return new_precedence > old_precedence;

	const bool old_generic = IsGenericName(existing.friendly_name);
	const bool new_generic = IsGenericName(incoming.friendly_name);
	if (old_generic != new_generic)
		return old_generic;

	/* same quality of names: a record the device described
	   itself beats a guess */
	return std::holds_alternative<KnownClass>(incoming.classification) &&
		!std::holds_alternative<KnownClass>(existing.classification);
}

bool
MergeDevice(Device &existing, const Device &incoming,
	    const MergePolicy &policy) noexcept
{
	assert(existing.GetKey() == incoming.GetKey());

	bool modified = false;

	if (policy.ShouldReplaceCore(existing, incoming)) {
		DeviceMetadata metadata = std::move(existing.metadata);
		Device replacement = incoming;
		replacement.metadata = std::move(metadata);
		existing = std::move(replacement);
		modified = true;
	}

	for (const auto &[key, value] : incoming.metadata) {
		auto i = existing.metadata.find(key);
		if (i == existing.metadata.end()) {
			existing.metadata.emplace(key, value);
			modified = true;
		} else if (i->second != value) {
			i->second = value;
			modified = true;
		}
	}

	return modified;
}
