#pragma once

#include "spot-window/selectors/interval_selector.hpp"

namespace spotwindow::selectors {

/**
 * @class ContiguousSelector
 * @brief Picks the single uninterrupted run with the lowest (or highest) cost.
 *
 * Runs start at a slot boundary inside the window and extend over adjacent
 * slots until they span the required duration; the last slot contributes
 * only the remainder. Cost is price x overlap summed over the run. Equal
 * costs resolve to the earliest start. A gap in the price data ends a run.
 *
 * If no run can span the required duration, the longest gap-free stretch is
 * returned instead.
 */
class ContiguousSelector final : public IIntervalSelector {
public:
	core::SelectionResult select(const core::Window &window, const core::PriceSeries &series, core::Duration required,
	                             core::PriceMode price_mode) const override;

	core::IntervalMode mode() const override {
		return core::IntervalMode::Contiguous;
	}

	std::string getName() const override {
		return "ContiguousSelector";
	}
};

} // namespace spotwindow::selectors
