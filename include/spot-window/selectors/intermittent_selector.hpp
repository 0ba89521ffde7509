#pragma once

#include "spot-window/selectors/interval_selector.hpp"

namespace spotwindow::selectors {

/**
 * @class IntermittentSelector
 * @brief Picks the cheapest (or most expensive) slots regardless of adjacency.
 *
 * Slots are taken in price order, earlier slots first on equal prices, until
 * the required duration is reached; the last one is cut to the remainder.
 * Every pick becomes its own interval ranked by the order it was taken in.
 * Adjacent picks are never merged.
 */
class IntermittentSelector final : public IIntervalSelector {
public:
	core::SelectionResult select(const core::Window &window, const core::PriceSeries &series, core::Duration required,
	                             core::PriceMode price_mode) const override;

	core::IntervalMode mode() const override {
		return core::IntervalMode::Intermittent;
	}

	std::string getName() const override {
		return "IntermittentSelector";
	}
};

} // namespace spotwindow::selectors
