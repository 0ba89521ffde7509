#pragma once

#include "spot-window/core/price_series.hpp"
#include "spot-window/core/selection.hpp"
#include "spot-window/core/window.hpp"

#include <vector>

namespace spotwindow::selectors::segments {

/**
 * @brief Clips the series to the window and records coverage problems on the result.
 *
 * Sets result.required, flags InfeasibleDuration when the window is shorter
 * than required and InsufficientCoverage when slots leave part of it uncovered.
 */
std::vector<core::PriceSegment> prepare(const core::Window &window, const core::PriceSeries &series,
                                        core::Duration required, core::SelectionResult &result);

/// True when candidate cost beats incumbent under the price mode; near-equal costs do not.
bool isPreferred(core::PriceMode mode, double candidate, double incumbent);

/// Ensures the requested duration is not negative.
void validateRequired(core::Duration required);

} // namespace spotwindow::selectors::segments
