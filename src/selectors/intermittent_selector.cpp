#include "spot-window/selectors/intermittent_selector.hpp"

#include "spot-window/selectors/segments.hpp"
#include "spot-window/utils/logging.hpp"

#include <algorithm>

namespace spotwindow::selectors {

core::SelectionResult IntermittentSelector::select(const core::Window &window, const core::PriceSeries &series,
                                                   core::Duration required, core::PriceMode price_mode) const {
	segments::validateRequired(required);

	core::SelectionResult result;
	result.required = required;
	if (required == core::Duration::zero()) {
		return result;
	}

	auto ordered = segments::prepare(window, series, required, result);

	// Segments arrive chronologically; a stable sort keeps earlier slots first on equal prices.
	switch (price_mode) {
	case core::PriceMode::Cheapest:
		std::stable_sort(ordered.begin(), ordered.end(),
		                 [](const core::PriceSegment &lhs, const core::PriceSegment &rhs) { return lhs.price < rhs.price; });
		break;
	case core::PriceMode::MostExpensive:
		std::stable_sort(ordered.begin(), ordered.end(),
		                 [](const core::PriceSegment &lhs, const core::PriceSegment &rhs) { return lhs.price > rhs.price; });
		break;
	}

	int rank = 0;
	for (const auto &segment : ordered) {
		if (result.selected >= required) {
			break;
		}
		const auto take = std::min(segment.span(), required - result.selected);

		core::SelectedInterval interval;
		interval.start = segment.start;
		interval.end = segment.start + take;
		interval.rank = ++rank;
		interval.price = segment.price;

		result.selected += take;
		result.total_cost += segment.price * core::toHours(take);
		result.intervals.push_back(interval);
	}

	SPOTWINDOW_DEBUG("Intermittent {} selection picked {} intervals covering {} of {}.", core::toString(price_mode),
	                 result.intervals.size(), core::formatDuration(result.selected), core::formatDuration(required));
	return result;
}

} // namespace spotwindow::selectors
