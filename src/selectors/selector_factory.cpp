#include "spot-window/selectors/selector_factory.hpp"

#include "spot-window/selectors/contiguous_selector.hpp"
#include "spot-window/selectors/intermittent_selector.hpp"

#include <stdexcept>

namespace spotwindow::selectors {

std::unique_ptr<IIntervalSelector> makeSelector(core::IntervalMode mode) {
	switch (mode) {
	case core::IntervalMode::Contiguous:
		return std::make_unique<ContiguousSelector>();
	case core::IntervalMode::Intermittent:
		return std::make_unique<IntermittentSelector>();
	}
	throw std::invalid_argument("Unknown interval mode.");
}

core::SelectionResult select(const core::Window &window, const core::PriceSeries &series, core::Duration required,
                             core::PriceMode price_mode, core::IntervalMode interval_mode) {
	return makeSelector(interval_mode)->select(window, series, required, price_mode);
}

} // namespace spotwindow::selectors
