#pragma once

#include "spot-window/core/time_zone.hpp"
#include "spot-window/core/window.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace spotwindow::resolvers {

/**
 * @class InvalidWindowError
 * @brief Raised when configured start and end times cannot form a window.
 */
class InvalidWindowError : public std::invalid_argument {
public:
	explicit InvalidWindowError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @class WindowResolver
 * @brief Turns "earliest start" / "latest end" wall-clock settings into concrete windows.
 *
 * A latest end at or before the earliest start refers to the following day,
 * so 22:00-06:00 spans midnight and 07:00-07:00 spans a full day.
 */
class WindowResolver {
public:
	explicit WindowResolver(core::TimeZone zone = core::TimeZone::utc()) : zone_(std::move(zone)) {
	}

	/**
	 * @brief Resolves the window beginning on the given local date.
	 * @throws InvalidWindowError If the resolved end is not after the start.
	 */
	core::Window resolve(const core::TimeOfDay &earliest_start, const core::TimeOfDay &latest_end,
	                     const core::LocalDate &reference_date) const;

	/**
	 * @brief Resolves the window that is current (or next) at the given instant.
	 *
	 * For windows crossing midnight, an instant before today's latest end still
	 * belongs to the window that started yesterday.
	 */
	core::Window resolveAt(const core::TimeOfDay &earliest_start, const core::TimeOfDay &latest_end,
	                       const core::TimePoint &now) const;

	/**
	 * @brief Resolves the configured window on the local day after the one the given window starts on.
	 * @throws InvalidWindowError If that day's window is collapsed by a DST gap.
	 */
	core::Window nextDay(const core::TimeOfDay &earliest_start, const core::TimeOfDay &latest_end,
	                     const core::Window &window) const;

	const core::TimeZone &timeZone() const {
		return zone_;
	}

private:
	core::TimeZone zone_;
};

} // namespace spotwindow::resolvers
