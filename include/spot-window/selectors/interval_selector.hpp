#pragma once

#include "spot-window/core/price_series.hpp"
#include "spot-window/core/selection.hpp"
#include "spot-window/core/window.hpp"

#include <string>

namespace spotwindow::selectors {

/**
 * @class IIntervalSelector
 * @brief Interface for strategies that pick run time out of a price series.
 *
 * Implementations are pure: the same window, prices, duration and mode always
 * produce the same, identically ordered result. When the window cannot supply
 * the required duration they return the best partial selection and record why
 * in SelectionResult::issues instead of failing.
 */
class IIntervalSelector {
public:
	virtual ~IIntervalSelector() = default;

	/**
	 * @brief Selects the run time for one window.
	 * @param window Bounds of the selectable time.
	 * @param series Price slots; only the parts inside the window are considered.
	 * @param required How long the device has to run.
	 * @param price_mode Whether to minimize or maximize cost.
	 * @throws std::invalid_argument If required is negative.
	 */
	virtual core::SelectionResult select(const core::Window &window, const core::PriceSeries &series,
	                                     core::Duration required, core::PriceMode price_mode) const = 0;

	virtual core::IntervalMode mode() const = 0;

	virtual std::string getName() const = 0;
};

} // namespace spotwindow::selectors
