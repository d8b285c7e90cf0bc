// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Metrics.hxx"
#include "control/Result.hxx"


std::chrono::milliseconds
MetricsSnapshot::GetAverageSoapTime() const noexcept
{
	std::chrono::milliseconds sum{};
	unsigned n = 0;

	for (const auto &i : device_results) {
		if (i.succeeded) {
			sum += i.duration;
			++n;
		}
	}

	return n > 0 ? sum / n : sum;
}

const DeviceControlRecord *
MetricsSnapshot::GetFastest() const noexcept
{
	const DeviceControlRecord *result = nullptr;

	for (const auto &i : device_results)
		if (i.succeeded &&
		    (result == nullptr || i.duration < result->duration))
			result = &i;

	return result;
}

const DeviceControlRecord *
MetricsSnapshot::GetSlowest() const noexcept
{
	const DeviceControlRecord *result = nullptr;

	for (const auto &i : device_results)
		if (i.succeeded &&
		    (result == nullptr || i.duration > result->duration))
			result = &i;

	return result;
}

void
MetricsAccumulator::AddResult(const Device &device,
			      const ControlResult &result) noexcept
{
	if (result.succeeded)
		++current.successes;
	else
		++current.failures;

	current.device_results.push_back({
		result.device,
		device.friendly_name,
		device.manufacturer,
		device.method,
		result.succeeded,
		result.duration,
		result.error,
	});

	const std::string_view manufacturer = device.manufacturer.empty()
		? std::string_view{"Unknown"}
		: std::string_view{device.manufacturer};

	auto i = current.manufacturers.find(manufacturer);
	if (i == current.manufacturers.end())
		i = current.manufacturers.emplace(std::string{manufacturer},
						  ControlCounters{}).first;

	auto &m = i->second;
	++m.attempts;
	if (result.succeeded)
		++m.successes;

	auto &method = current.methods[std::size_t(device.method)];
	++method.attempts;
	if (result.succeeded)
		++method.successes;
}
