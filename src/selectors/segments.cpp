#include "spot-window/selectors/segments.hpp"

#include "spot-window/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace spotwindow::selectors::segments {

std::vector<core::PriceSegment> prepare(const core::Window &window, const core::PriceSeries &series,
                                        core::Duration required, core::SelectionResult &result) {
	result.required = required;

	if (required > window.span()) {
		SPOTWINDOW_DEBUG("Required duration {} exceeds window length {}.", core::formatDuration(required),
		                 core::formatDuration(window.span()));
		result.addIssue(core::SelectionIssue::InfeasibleDuration);
	}

	const auto covered = series.coverage(window);
	if (covered < window.span()) {
		SPOTWINDOW_DEBUG("Price slots cover {} of a {} window.", core::formatDuration(covered),
		                 core::formatDuration(window.span()));
		result.addIssue(core::SelectionIssue::InsufficientCoverage);
	}

	const auto width = series.inferSlotWidth();
	SPOTWINDOW_DEBUG("Selecting from {} slots of {} width{}.", series.size(),
	                 width ? core::formatDuration(*width) : std::string("mixed"),
	                 series.isContiguous() ? "" : " with gaps");

	return series.clip(window);
}

bool isPreferred(core::PriceMode mode, double candidate, double incumbent) {
	const double tolerance = 1e-9 * std::max(1.0, std::abs(incumbent));
	switch (mode) {
	case core::PriceMode::Cheapest:
		return candidate < incumbent - tolerance;
	case core::PriceMode::MostExpensive:
		return candidate > incumbent + tolerance;
	}
	return false;
}

void validateRequired(core::Duration required) {
	if (required < core::Duration::zero()) {
		throw std::invalid_argument("Required duration must be non-negative.");
	}
}

} // namespace spotwindow::selectors::segments
