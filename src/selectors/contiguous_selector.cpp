#include "spot-window/selectors/contiguous_selector.hpp"

#include "spot-window/selectors/segments.hpp"
#include "spot-window/utils/logging.hpp"

#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace spotwindow::selectors {

namespace {

struct Run {
	std::size_t first = 0;
	core::TimePoint start{};
	core::TimePoint end{};
	double cost = 0.0;
};

// Index of the last segment reachable from each segment without crossing a gap.
std::vector<std::size_t> blockEnds(const std::vector<core::PriceSegment> &segments) {
	std::vector<std::size_t> ends(segments.size());
	for (std::size_t i = segments.size(); i-- > 0;) {
		const bool joins_next = i + 1 < segments.size() && segments[i].end == segments[i + 1].start;
		ends[i] = joins_next ? ends[i + 1] : i;
	}
	return ends;
}

} // namespace

core::SelectionResult ContiguousSelector::select(const core::Window &window, const core::PriceSeries &series,
                                                 core::Duration required, core::PriceMode price_mode) const {
	segments::validateRequired(required);

	core::SelectionResult result;
	result.required = required;
	if (required == core::Duration::zero()) {
		return result;
	}

	const auto clipped = segments::prepare(window, series, required, result);
	if (clipped.empty()) {
		SPOTWINDOW_DEBUG("No price slots inside the window; nothing to select.");
		return result;
	}

	const auto n = static_cast<Eigen::Index>(clipped.size());
	Eigen::VectorXd prices(n);
	Eigen::VectorXd hours(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		prices[i] = clipped[static_cast<std::size_t>(i)].price;
		hours[i] = core::toHours(clipped[static_cast<std::size_t>(i)].span());
	}
	const auto block_end = blockEnds(clipped);

	std::optional<Run> best;
	for (std::size_t first = 0; first < clipped.size(); ++first) {
		std::size_t last = first;
		core::Duration covered = core::Duration::zero();
		while (last <= block_end[first] && covered + clipped[last].span() < required) {
			covered += clipped[last].span();
			++last;
		}
		if (last > block_end[first]) {
			continue;
		}

		const auto full = static_cast<Eigen::Index>(last - first);
		const auto offset = static_cast<Eigen::Index>(first);
		const double cost = prices.segment(offset, full).dot(hours.segment(offset, full)) +
		                    clipped[last].price * core::toHours(required - covered);

		if (!best || segments::isPreferred(price_mode, cost, best->cost)) {
			best = Run{first, clipped[first].start, clipped[first].start + required, cost};
		}
	}

	if (!best) {
		// No run spans the full duration: fall back to the longest gap-free stretch.
		core::Duration longest = core::Duration::zero();
		for (std::size_t first = 0; first < clipped.size(); first = block_end[first] + 1) {
			const auto last = block_end[first];
			const auto span = clipped[last].end - clipped[first].start;
			const auto offset = static_cast<Eigen::Index>(first);
			const auto count = static_cast<Eigen::Index>(last - first + 1);
			const double cost = prices.segment(offset, count).dot(hours.segment(offset, count));
			if (!best || span > longest || (span == longest && segments::isPreferred(price_mode, cost, best->cost))) {
				best = Run{first, clipped[first].start, clipped[last].end, cost};
				longest = span;
			}
		}
		SPOTWINDOW_DEBUG("No contiguous run spans {}; using longest stretch of {}.", core::formatDuration(required),
		                 core::formatDuration(longest));
	}

	core::SelectedInterval interval;
	interval.start = best->start;
	interval.end = best->end;
	interval.price = best->cost / core::toHours(best->end - best->start);

	result.selected = interval.span();
	result.total_cost = best->cost;
	result.intervals.push_back(interval);

	SPOTWINDOW_DEBUG("Contiguous {} run selected {} after window start, lasting {}, cost {}.",
	                 core::toString(price_mode), core::formatDuration(best->start - window.start),
	                 core::formatDuration(interval.span()), best->cost);
	return result;
}

} // namespace spotwindow::selectors
