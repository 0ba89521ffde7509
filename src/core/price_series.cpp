#include "spot-window/core/price_series.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace spotwindow::core {

std::string toString(PriceUnit unit) {
	switch (unit) {
	case PriceUnit::EurPerMWh:
		return "EUR/MWh";
	case PriceUnit::GbpPerMWh:
		return "GBP/MWh";
	case PriceUnit::CtPerKWh:
		return "ct/kWh";
	case PriceUnit::PencePerKWh:
		return "pence/kWh";
	case PriceUnit::PerKWh:
		return "€/£/kWh";
	}
	throw std::invalid_argument("Unknown price unit.");
}

PriceSlot PriceSlot::fromRecord(TimePoint start, TimePoint end, const std::unordered_map<std::string, double> &fields) {
	if (end <= start) {
		throw std::invalid_argument("Price slot must have end strictly after start.");
	}

	static const std::array<std::pair<const char *, PriceUnit>, 5> candidates{{
	    {"price_eur_per_mwh", PriceUnit::EurPerMWh},
	    {"price_gbp_per_mwh", PriceUnit::GbpPerMWh},
	    {"price_ct_per_kwh", PriceUnit::CtPerKWh},
	    {"price_pence_per_kwh", PriceUnit::PencePerKWh},
	    {"price_per_kwh", PriceUnit::PerKWh},
	}};

	for (const auto &candidate : candidates) {
		const auto it = fields.find(candidate.first);
		if (it != fields.end()) {
			return PriceSlot{start, end, it->second, candidate.second};
		}
	}
	throw std::invalid_argument("No valid price field found.");
}

PriceSeries::PriceSeries(std::vector<PriceSlot> slots) : slots_(std::move(slots)) {
	for (std::size_t i = 0; i < slots_.size(); ++i) {
		if (slots_[i].end <= slots_[i].start) {
			throw std::invalid_argument("Price slots must have end strictly after start.");
		}
		if (i > 0) {
			if (slots_[i].start <= slots_[i - 1].start) {
				throw std::invalid_argument("Price slots must be strictly increasing by start time.");
			}
			if (slots_[i].start < slots_[i - 1].end) {
				throw std::invalid_argument("Price slots must not overlap.");
			}
		}
	}
}

bool PriceSeries::isContiguous() const {
	for (std::size_t i = 1; i < slots_.size(); ++i) {
		if (slots_[i].start != slots_[i - 1].end) {
			return false;
		}
	}
	return true;
}

std::optional<Duration> PriceSeries::inferSlotWidth() const {
	if (slots_.empty()) {
		return std::nullopt;
	}
	const auto width = slots_.front().span();
	const bool uniform = std::all_of(slots_.begin() + 1, slots_.end(),
	                                 [&](const PriceSlot &slot) { return slot.span() == width; });
	if (!uniform) {
		return std::nullopt;
	}
	return width;
}

std::optional<PriceSlot> PriceSeries::slotAt(const TimePoint &tp) const {
	auto it = std::upper_bound(slots_.begin(), slots_.end(), tp,
	                           [](const TimePoint &value, const PriceSlot &slot) { return value < slot.start; });
	if (it == slots_.begin()) {
		return std::nullopt;
	}
	--it;
	if (!it->contains(tp)) {
		return std::nullopt;
	}
	return *it;
}

std::vector<PriceSegment> PriceSeries::clip(const Window &window) const {
	std::vector<PriceSegment> segments;
	for (const auto &slot : slots_) {
		if (slot.end <= window.start) {
			continue;
		}
		if (slot.start >= window.end) {
			break;
		}
		segments.push_back(PriceSegment{std::max(slot.start, window.start), std::min(slot.end, window.end), slot.price});
	}
	return segments;
}

Duration PriceSeries::coverage(const Window &window) const {
	Duration covered = Duration::zero();
	for (const auto &slot : slots_) {
		covered += window.overlap(slot.start, slot.end);
	}
	return covered;
}

} // namespace spotwindow::core
