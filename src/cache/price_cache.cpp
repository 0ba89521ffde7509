#include "spot-window/cache/price_cache.hpp"

#include "spot-window/utils/logging.hpp"

#include <map>
#include <stdexcept>

namespace spotwindow::cache {

PriceCache::PriceCache(core::Duration retention) : retention_(retention) {
	if (retention_ < core::Duration::zero()) {
		throw std::invalid_argument("Price cache retention must be non-negative.");
	}
}

const core::PriceSeries &PriceCache::merge(const std::vector<core::PriceSlot> &fresh, const core::TimePoint &now) {
	std::map<core::TimePoint, core::PriceSlot> merged;
	for (const auto &slot : fresh) {
		merged[slot.start] = slot;
	}

	const auto overlapsMerged = [&merged](const core::PriceSlot &slot) {
		auto it = merged.lower_bound(slot.end);
		if (it == merged.begin()) {
			return false;
		}
		--it;
		return it->second.end > slot.start;
	};

	std::size_t replaced = 0;
	for (const auto &slot : series_.slots()) {
		if (overlapsMerged(slot)) {
			++replaced;
			continue;
		}
		merged.emplace(slot.start, slot);
	}

	const auto cutoff = now - retention_;
	std::vector<core::PriceSlot> kept;
	kept.reserve(merged.size());
	for (const auto &entry : merged) {
		if (entry.second.start >= cutoff) {
			kept.push_back(entry.second);
		}
	}

	const auto expired = merged.size() - kept.size();
	series_ = core::PriceSeries(std::move(kept));
	SPOTWINDOW_DEBUG("Price cache merged {} fresh slots ({} cached replaced, {} expired); {} slots cached.",
	                 fresh.size(), replaced, expired, series_.size());
	return series_;
}

} // namespace spotwindow::cache
