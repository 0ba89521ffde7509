#pragma once

#include "spot-window/core/selection.hpp"
#include "spot-window/core/time_zone.hpp"
#include "spot-window/core/window.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spotwindow::state {

/**
 * @struct EvaluationContext
 * @brief Configuration and resolved inputs echoed back through the attributes.
 */
struct EvaluationContext {
	core::TimeOfDay earliest_start;
	core::TimeOfDay latest_end;
	core::Duration duration = core::Duration::zero();
	core::TimePoint interval_start{};
	core::PriceMode price_mode = core::PriceMode::Cheapest;
	core::IntervalMode interval_mode = core::IntervalMode::Contiguous;
};

using AttributeList = std::vector<std::pair<std::string, std::string>>;

/**
 * @struct Attributes
 * @brief Observable details of one evaluation.
 */
struct Attributes {
	core::TimeOfDay earliest_start;
	core::TimeOfDay latest_end;
	core::Window window;
	core::Duration duration = core::Duration::zero();
	core::TimePoint interval_start{};
	core::PriceMode price_mode = core::PriceMode::Cheapest;
	core::IntervalMode interval_mode = core::IntervalMode::Contiguous;
	bool enabled = false;
	bool incomplete = false;
	std::optional<double> mean_price;
	std::vector<core::SelectionIssue> issues;
	std::vector<core::SelectedInterval> intervals; // chronological

	/**
	 * @brief Renders the attributes as ordered key/value strings.
	 *
	 * Instants are local ISO-8601 in the given zone. Intervals are flattened to
	 * data[i].start_time, data[i].end_time, data[i].rank (when ranked) and
	 * data[i].price.
	 */
	AttributeList toList(const core::TimeZone &zone) const;
};

struct StateSnapshot {
	bool enabled = false;
	bool active = false;
	Attributes attributes;
};

/**
 * @brief Projects a selection onto the current instant.
 *
 * enabled is true while now lies in the window, active while now lies in one
 * of the selected intervals.
 */
StateSnapshot evaluate(const core::SelectionResult &selection, const core::Window &window, const core::TimePoint &now,
                       const EvaluationContext &context);

} // namespace spotwindow::state
