#include "spot-window/core/time_zone.hpp"

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace spotwindow::core {

namespace pt = boost::posix_time;
namespace lt = boost::local_time;

namespace {

const pt::ptime &epoch() {
	static const pt::ptime value(boost::gregorian::date(1970, 1, 1));
	return value;
}

pt::ptime toPtime(const TimePoint &tp) {
	const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
	return epoch() + pt::microseconds(micros);
}

TimePoint fromPtime(const pt::ptime &value) {
	if (value.is_special()) {
		throw std::out_of_range("Cannot convert a special date-time value to an instant.");
	}
	const auto micros = (value - epoch()).total_microseconds();
	return TimePoint(std::chrono::duration_cast<Duration>(std::chrono::microseconds(micros)));
}

pt::time_duration toTimeDuration(const TimeOfDay &time_of_day) {
	return pt::hours(time_of_day.hour) + pt::minutes(time_of_day.minute) + pt::seconds(time_of_day.second);
}

int parseField(const std::string &field, const std::string &text) {
	if (field.empty() || field.size() > 2) {
		throw std::invalid_argument("Malformed time of day '" + text + "'.");
	}
	for (char c : field) {
		if (c < '0' || c > '9') {
			throw std::invalid_argument("Malformed time of day '" + text + "'.");
		}
	}
	return std::stoi(field);
}

} // namespace

// --- TimeOfDay ---

TimeOfDay TimeOfDay::of(int hour, int minute, int second) {
	if (hour < 0 || hour > 23) {
		throw std::invalid_argument("Hour must be between 0 and 23.");
	}
	if (minute < 0 || minute > 59) {
		throw std::invalid_argument("Minute must be between 0 and 59.");
	}
	if (second < 0 || second > 59) {
		throw std::invalid_argument("Second must be between 0 and 59.");
	}
	return TimeOfDay{hour, minute, second};
}

TimeOfDay TimeOfDay::parse(const std::string &text) {
	std::vector<std::string> fields;
	std::stringstream stream(text);
	std::string field;
	while (std::getline(stream, field, ':')) {
		fields.push_back(field);
	}
	if (fields.size() < 2 || fields.size() > 3 || (!text.empty() && text.back() == ':')) {
		throw std::invalid_argument("Time of day must be formatted as HH:MM or HH:MM:SS, got '" + text + "'.");
	}
	const int hour = parseField(fields[0], text);
	const int minute = parseField(fields[1], text);
	const int second = fields.size() == 3 ? parseField(fields[2], text) : 0;
	return of(hour, minute, second);
}

std::string TimeOfDay::toString() const {
	return fmt::format("{:02}:{:02}:{:02}", hour, minute, second);
}

// --- TimeZone ---

TimeZone::TimeZone() : TimeZone("UTC0") {
}

TimeZone::TimeZone(const std::string &posix_rule) : rule_(posix_rule) {
	if (posix_rule.empty()) {
		throw std::invalid_argument("Time zone rule must not be empty.");
	}
	try {
		zone_ = lt::time_zone_ptr(new lt::posix_time_zone(posix_rule));
	} catch (const std::exception &error) {
		throw std::invalid_argument("Invalid POSIX time zone rule '" + posix_rule + "': " + error.what());
	}
}

TimePoint TimeZone::combine(const LocalDate &date, const TimeOfDay &time_of_day) const {
	const auto td = toTimeDuration(time_of_day);
	switch (lt::local_date_time::check_dst(date, td, zone_)) {
	case boost::date_time::ambiguous:
		return fromPtime(lt::local_date_time(date, td, zone_, true).utc_time());
	case boost::date_time::invalid_time_label:
		return fromPtime(pt::ptime(date, td) - zone_->base_utc_offset());
	case boost::date_time::is_in_dst:
	case boost::date_time::is_not_in_dst:
		break;
	}
	return fromPtime(lt::local_date_time(date, td, zone_, lt::local_date_time::EXCEPTION_ON_ERROR).utc_time());
}

LocalDate TimeZone::localDate(const TimePoint &tp) const {
	return lt::local_date_time(toPtime(tp), zone_).local_time().date();
}

TimeOfDay TimeZone::localTimeOfDay(const TimePoint &tp) const {
	const auto local = lt::local_date_time(toPtime(tp), zone_).local_time().time_of_day();
	return TimeOfDay{static_cast<int>(local.hours()), static_cast<int>(local.minutes()),
	                 static_cast<int>(local.seconds())};
}

std::chrono::minutes TimeZone::utcOffset(const TimePoint &tp) const {
	const auto utc = toPtime(tp);
	const auto local = lt::local_date_time(utc, zone_).local_time();
	return std::chrono::minutes((local - utc).total_seconds() / 60);
}

std::string TimeZone::formatIso(const TimePoint &tp) const {
	const auto local = lt::local_date_time(toPtime(tp), zone_).local_time();
	const auto tod = local.time_of_day();
	const pt::ptime whole_seconds(local.date(), pt::hours(tod.hours()) + pt::minutes(tod.minutes()) +
	                                                pt::seconds(tod.seconds()));

	const auto offset = utcOffset(tp).count();
	const auto magnitude = offset < 0 ? -offset : offset;
	return fmt::format("{}{}{:02}:{:02}", pt::to_iso_extended_string(whole_seconds), offset < 0 ? '-' : '+',
	                   magnitude / 60, magnitude % 60);
}

// --- Duration helpers ---

double toHours(Duration duration) {
	return std::chrono::duration<double, std::ratio<3600>>(duration).count();
}

std::string formatDuration(Duration duration) {
	const bool negative = duration < Duration::zero();
	auto total = std::chrono::duration_cast<std::chrono::seconds>(negative ? -duration : duration).count();
	const auto days = total / 86400;
	total %= 86400;

	std::string result = negative ? "-" : "";
	if (days > 0) {
		result += fmt::format("{} {}, ", days, days == 1 ? "day" : "days");
	}
	return result + fmt::format("{}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

} // namespace spotwindow::core
