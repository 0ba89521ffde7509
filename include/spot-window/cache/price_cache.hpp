#pragma once

#include "spot-window/core/price_series.hpp"

#include <chrono>
#include <vector>

namespace spotwindow::cache {

/**
 * @class PriceCache
 * @brief Keeps recently seen price slots so windows stay evaluable after a provider drops old data.
 *
 * Providers typically publish today and, from early afternoon, tomorrow. A
 * window crossing midnight still needs yesterday's evening prices after the
 * provider has rolled over, so slots are retained for a day.
 */
class PriceCache {
public:
	explicit PriceCache(core::Duration retention = std::chrono::hours(24));

	/**
	 * @brief Merges freshly delivered slots with the cached ones.
	 *
	 * Fresh slots replace cached slots with the same start or an overlapping
	 * span. Slots starting more than the retention period before now are
	 * dropped. The merged series becomes the new cache content.
	 *
	 * @throws std::invalid_argument If the fresh slots overlap each other.
	 */
	const core::PriceSeries &merge(const std::vector<core::PriceSlot> &fresh, const core::TimePoint &now);

	const core::PriceSeries &series() const {
		return series_;
	}

	bool isEmpty() const {
		return series_.isEmpty();
	}

	void clear() {
		series_ = core::PriceSeries();
	}

private:
	core::Duration retention_;
	core::PriceSeries series_;
};

} // namespace spotwindow::cache
