#pragma once

#include "spot-window/selectors/interval_selector.hpp"

#include <memory>

namespace spotwindow::selectors {

/// Creates the selector implementing the given interval mode.
std::unique_ptr<IIntervalSelector> makeSelector(core::IntervalMode mode);

/**
 * @brief One-shot selection without keeping a selector around.
 */
core::SelectionResult select(const core::Window &window, const core::PriceSeries &series, core::Duration required,
                             core::PriceMode price_mode, core::IntervalMode interval_mode);

} // namespace spotwindow::selectors
