#pragma once

#include "spot-window/core/time_zone.hpp"

#include <algorithm>
#include <stdexcept>

namespace spotwindow::core {

/**
 * @struct Window
 * @brief The half-open range [start, end) in which a device may run.
 */
struct Window {
	TimePoint start{};
	TimePoint end{};

	/**
	 * @throws std::invalid_argument If end is not strictly after start.
	 */
	static Window spanning(TimePoint start_time, TimePoint end_time) {
		if (end_time <= start_time) {
			throw std::invalid_argument("Window must have end strictly after start.");
		}
		return Window{start_time, end_time};
	}

	Duration span() const {
		return end - start;
	}

	bool contains(const TimePoint &tp) const {
		return start <= tp && tp < end;
	}

	/// Length of the intersection with [from, to), zero when disjoint.
	Duration overlap(const TimePoint &from, const TimePoint &to) const {
		const auto lo = std::max(start, from);
		const auto hi = std::min(end, to);
		return hi > lo ? hi - lo : Duration::zero();
	}

	friend bool operator==(const Window &lhs, const Window &rhs) {
		return lhs.start == rhs.start && lhs.end == rhs.end;
	}
	friend bool operator!=(const Window &lhs, const Window &rhs) {
		return !(lhs == rhs);
	}
};

} // namespace spotwindow::core
