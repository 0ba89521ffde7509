#include "spot-window/resolvers/window_resolver.hpp"

#include "spot-window/utils/logging.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>

namespace spotwindow::resolvers {

namespace {

const boost::gregorian::days kOneDay(1);

} // namespace

core::Window WindowResolver::resolve(const core::TimeOfDay &earliest_start, const core::TimeOfDay &latest_end,
                                     const core::LocalDate &reference_date) const {
	const auto end_date = latest_end <= earliest_start ? reference_date + kOneDay : reference_date;
	const auto start = zone_.combine(reference_date, earliest_start);
	const auto end = zone_.combine(end_date, latest_end);
	if (end <= start) {
		throw InvalidWindowError("Latest end " + latest_end.toString() + " cannot be resolved after earliest start " +
		                         earliest_start.toString() + " on " +
		                         boost::gregorian::to_iso_extended_string(reference_date) + ".");
	}
	return core::Window{start, end};
}

core::Window WindowResolver::resolveAt(const core::TimeOfDay &earliest_start, const core::TimeOfDay &latest_end,
                                       const core::TimePoint &now) const {
	const auto today = zone_.localDate(now);
	if (latest_end <= earliest_start && now < zone_.combine(today, latest_end)) {
		return resolve(earliest_start, latest_end, today - kOneDay);
	}
	return resolve(earliest_start, latest_end, today);
}

core::Window WindowResolver::nextDay(const core::TimeOfDay &earliest_start, const core::TimeOfDay &latest_end,
                                     const core::Window &window) const {
	const auto next = resolve(earliest_start, latest_end, zone_.localDate(window.start) + kOneDay);
	SPOTWINDOW_TRACE("Next-day window {} -> {}.", zone_.formatIso(next.start), zone_.formatIso(next.end));
	return next;
}

} // namespace spotwindow::resolvers
