#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/local_time_types.hpp>
#include <chrono>
#include <string>

namespace spotwindow::core {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using LocalDate = boost::gregorian::date;

/**
 * @struct TimeOfDay
 * @brief A wall-clock time without date or zone, as configured by the user.
 */
struct TimeOfDay {
	int hour = 0;
	int minute = 0;
	int second = 0;

	/**
	 * @brief Builds a validated time of day.
	 * @throws std::invalid_argument If any field is out of range.
	 */
	static TimeOfDay of(int hour, int minute, int second = 0);

	/**
	 * @brief Parses "HH:MM" or "HH:MM:SS".
	 * @throws std::invalid_argument On malformed or out-of-range input.
	 */
	static TimeOfDay parse(const std::string &text);

	std::chrono::seconds sinceMidnight() const {
		return std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second);
	}

	std::string toString() const;

	friend bool operator==(const TimeOfDay &lhs, const TimeOfDay &rhs) {
		return lhs.sinceMidnight() == rhs.sinceMidnight();
	}
	friend bool operator!=(const TimeOfDay &lhs, const TimeOfDay &rhs) {
		return !(lhs == rhs);
	}
	friend bool operator<(const TimeOfDay &lhs, const TimeOfDay &rhs) {
		return lhs.sinceMidnight() < rhs.sinceMidnight();
	}
	friend bool operator<=(const TimeOfDay &lhs, const TimeOfDay &rhs) {
		return !(rhs < lhs);
	}
};

/**
 * @class TimeZone
 * @brief Calendar arithmetic for one POSIX TZ rule (e.g. "CET-1CEST,M3.5.0/2,M10.5.0/3").
 *
 * Converts between local wall-clock labels and UTC instants, honouring
 * daylight-saving transitions. Wall-clock times that fall into a
 * spring-forward gap are read with the standard offset, which moves them
 * forward by the gap length. Ambiguous fall-back times resolve to the earlier
 * (daylight) instant.
 */
class TimeZone {
public:
	/// UTC.
	TimeZone();

	/**
	 * @brief Creates a zone from a POSIX TZ rule.
	 * @throws std::invalid_argument If the rule cannot be parsed.
	 */
	explicit TimeZone(const std::string &posix_rule);

	static TimeZone utc() {
		return TimeZone();
	}

	const std::string &rule() const {
		return rule_;
	}

	TimePoint combine(const LocalDate &date, const TimeOfDay &time_of_day) const;
	LocalDate localDate(const TimePoint &tp) const;
	TimeOfDay localTimeOfDay(const TimePoint &tp) const;
	std::chrono::minutes utcOffset(const TimePoint &tp) const;

	/**
	 * @brief Formats an instant as local ISO-8601 with offset, e.g. "2024-03-31T03:00:00+02:00".
	 */
	std::string formatIso(const TimePoint &tp) const;

private:
	std::string rule_;
	boost::local_time::time_zone_ptr zone_;
};

/// Duration in fractional hours.
double toHours(Duration duration);

/// Renders a duration as "H:MM:SS", prefixed with "N day(s), " past 24 hours.
std::string formatDuration(Duration duration);

} // namespace spotwindow::core
