#include "spot-window/resolvers/duration_resolver.hpp"

#include "spot-window/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <unordered_map>

namespace spotwindow::resolvers {

namespace {

// Seconds per unit accepted from a duration signal.
const std::unordered_map<std::string, double> &unitScale() {
	static const std::unordered_map<std::string, double> scale{
	    {"d", 86400.0},  {"days", 86400.0},   {"h", 3600.0},   {"hours", 3600.0},
	    {"min", 60.0},   {"minutes", 60.0},   {"s", 1.0},      {"sec", 1.0},
	    {"seconds", 1.0}, {"ms", 0.001},      {"msec", 0.001}, {"milliseconds", 0.001},
	};
	return scale;
}

DurationResolution fromStatic(core::Duration duration, const core::Window &window) {
	DurationResolution resolution;
	resolution.duration = duration;
	resolution.interval_start = window.start;
	resolution.source = DurationSource::Static;
	return resolution;
}

std::optional<DurationResolution> fallback(const std::optional<core::Duration> &static_duration,
                                           const core::Window &window) {
	if (!static_duration) {
		SPOTWINDOW_WARN("No static duration configured to fall back to; duration is unavailable.");
		return std::nullopt;
	}
	return fromStatic(*static_duration, window);
}

} // namespace

std::optional<core::Duration> DurationResolver::convert(double value, const std::string &unit) {
	const auto it = unitScale().find(unit);
	if (it == unitScale().end() || !std::isfinite(value) || value < 0.0) {
		return std::nullopt;
	}
	const std::chrono::duration<double> seconds(value * it->second);
	if (seconds >= std::chrono::duration<double>(core::Duration::max())) {
		return std::nullopt;
	}
	return std::chrono::round<core::Duration>(seconds);
}

void DurationResolver::observe(double value, const DurationSignal &signal, const core::TimePoint &now) {
	if (!last_value_) {
		anchor_ = signal.last_changed;
	} else if (*last_value_ != value) {
		anchor_ = signal.last_changed.value_or(now);
		SPOTWINDOW_DEBUG("Duration signal changed from {} to {} {}.", *last_value_, value, signal.unit);
	}
	last_value_ = value;
}

std::optional<DurationResolution> DurationResolver::resolve(const std::optional<core::Duration> &static_duration,
                                                            const std::optional<DurationSignal> &signal,
                                                            const core::Window &window, const core::TimePoint &now) {
	if (!signal) {
		return fallback(static_duration, window);
	}

	if (!signal->value) {
		SPOTWINDOW_ERROR("Duration signal has no value.");
		return fallback(static_duration, window);
	}

	const double value = *signal->value;
	const auto duration = convert(value, signal->unit);
	if (!duration) {
		SPOTWINDOW_ERROR("Invalid duration signal value {} with unit of measurement \"{}\". "
		                 "Valid units of measurement: d, h, min, s, ms.",
		                 value, signal->unit);
		return fallback(static_duration, window);
	}

	observe(value, *signal, now);

	DurationResolution resolution;
	resolution.duration = *duration;
	resolution.anchor = anchor_;
	resolution.interval_start = window.start;
	resolution.source = DurationSource::Signal;
	if (anchor_ && window.start < *anchor_ && *anchor_ < window.end) {
		resolution.interval_start = *anchor_;
	}
	return resolution;
}

} // namespace spotwindow::resolvers
