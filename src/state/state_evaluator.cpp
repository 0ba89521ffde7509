#include "spot-window/state/state_evaluator.hpp"

#include <spdlog/fmt/fmt.h>

namespace spotwindow::state {

AttributeList Attributes::toList(const core::TimeZone &zone) const {
	AttributeList list{
	    {"earliest_start_time", earliest_start.toString()},
	    {"latest_end_time", latest_end.toString()},
	    {"duration", core::formatDuration(duration)},
	    {"interval_start_time", zone.formatIso(interval_start)},
	    {"price_mode", core::toString(price_mode)},
	    {"interval_mode", core::toString(interval_mode)},
	    {"enabled", enabled ? "true" : "false"},
	    {"incomplete", incomplete ? "true" : "false"},
	};
	if (mean_price) {
		list.emplace_back("mean_price", fmt::format("{}", *mean_price));
	}
	for (std::size_t i = 0; i < intervals.size(); ++i) {
		const auto &interval = intervals[i];
		const auto prefix = fmt::format("data[{}].", i);
		list.emplace_back(prefix + "start_time", zone.formatIso(interval.start));
		list.emplace_back(prefix + "end_time", zone.formatIso(interval.end));
		if (interval.rank) {
			list.emplace_back(prefix + "rank", std::to_string(*interval.rank));
		}
		list.emplace_back(prefix + "price", fmt::format("{}", interval.price));
	}
	return list;
}

StateSnapshot evaluate(const core::SelectionResult &selection, const core::Window &window, const core::TimePoint &now,
                       const EvaluationContext &context) {
	StateSnapshot snapshot;
	snapshot.enabled = window.contains(now);
	snapshot.active = selection.isActive(now);

	auto &attributes = snapshot.attributes;
	attributes.earliest_start = context.earliest_start;
	attributes.latest_end = context.latest_end;
	attributes.window = window;
	attributes.duration = context.duration;
	attributes.interval_start = context.interval_start;
	attributes.price_mode = context.price_mode;
	attributes.interval_mode = context.interval_mode;
	attributes.enabled = snapshot.enabled;
	attributes.incomplete = selection.incomplete();
	attributes.mean_price = selection.meanPrice();
	attributes.issues = selection.issues;
	attributes.intervals = selection.chronological();
	return snapshot;
}

} // namespace spotwindow::state
