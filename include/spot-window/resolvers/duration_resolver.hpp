#pragma once

#include "spot-window/core/time_zone.hpp"
#include "spot-window/core/window.hpp"

#include <optional>
#include <string>

namespace spotwindow::resolvers {

/**
 * @struct DurationSignal
 * @brief Snapshot of an external "remaining run time" value.
 */
struct DurationSignal {
	std::optional<double> value;                  // unset when the source reports nothing usable
	std::string unit;                             // d, h, min, s, ms and their long forms
	std::optional<core::TimePoint> last_changed;  // when the source last changed its value
};

enum class DurationSource {
	Static,
	Signal
};

struct DurationResolution {
	core::Duration duration = core::Duration::zero();
	std::optional<core::TimePoint> anchor;
	core::TimePoint interval_start{};
	DurationSource source = DurationSource::Static;
};

/**
 * @class DurationResolver
 * @brief Decides how long the device has to run in the current evaluation.
 *
 * Without a signal the configured static duration is used. With a signal, its
 * current value wins, and a value change inside the window moves the start of
 * the selectable interval to the change instant. The last observed value is
 * the only state kept between evaluations.
 */
class DurationResolver {
public:
	/**
	 * @param static_duration Configured fallback duration.
	 * @param signal External duration signal, unset when none is configured.
	 * @param window The resolved window.
	 * @param now Evaluation instant, used as change time when the signal reports none.
	 * @return The resolution, or nullopt when no usable duration exists.
	 */
	std::optional<DurationResolution> resolve(const std::optional<core::Duration> &static_duration,
	                                          const std::optional<DurationSignal> &signal,
	                                          const core::Window &window, const core::TimePoint &now);

	const std::optional<core::TimePoint> &anchor() const {
		return anchor_;
	}

	const std::optional<double> &lastValue() const {
		return last_value_;
	}

	void reset() {
		last_value_.reset();
		anchor_.reset();
	}

	/**
	 * @brief Converts a numeric value in the given unit to a duration.
	 * @return nullopt for unknown units, negative or non-finite values, and
	 *         values too large for the clock's duration type.
	 */
	static std::optional<core::Duration> convert(double value, const std::string &unit);

private:
	void observe(double value, const DurationSignal &signal, const core::TimePoint &now);

	std::optional<double> last_value_;
	std::optional<core::TimePoint> anchor_;
};

} // namespace spotwindow::resolvers
