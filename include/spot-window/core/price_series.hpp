#pragma once

#include "spot-window/core/time_zone.hpp"
#include "spot-window/core/window.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spotwindow::core {

enum class PriceUnit {
	EurPerMWh,
	GbpPerMWh,
	CtPerKWh,
	PencePerKWh,
	PerKWh
};

std::string toString(PriceUnit unit);

/**
 * @struct PriceSlot
 * @brief One fixed-length market period and its price.
 */
struct PriceSlot {
	TimePoint start{};
	TimePoint end{};
	double price = 0.0;
	PriceUnit unit = PriceUnit::EurPerMWh;

	Duration span() const {
		return end - start;
	}

	bool contains(const TimePoint &tp) const {
		return start <= tp && tp < end;
	}

	/**
	 * @brief Builds a slot from a provider record whose price may come under several field names.
	 *
	 * Fields are probed in the order price_eur_per_mwh, price_gbp_per_mwh,
	 * price_ct_per_kwh, price_pence_per_kwh, price_per_kwh; the first present
	 * one wins and determines the unit.
	 *
	 * @throws std::invalid_argument If no price field is present or end is not after start.
	 */
	static PriceSlot fromRecord(TimePoint start, TimePoint end, const std::unordered_map<std::string, double> &fields);
};

/**
 * @struct PriceSegment
 * @brief A slot clipped to a window: the part of a slot that can be selected.
 */
struct PriceSegment {
	TimePoint start{};
	TimePoint end{};
	double price = 0.0;

	Duration span() const {
		return end - start;
	}
};

/**
 * @class PriceSeries
 * @brief An ordered, non-overlapping sequence of price slots.
 *
 * Slots must be strictly increasing by start and may not overlap. Gaps are
 * permitted; they surface as incomplete window coverage during selection.
 */
class PriceSeries {
public:
	PriceSeries() = default;

	/**
	 * @throws std::invalid_argument If slots are unordered, overlapping, or have a non-positive span.
	 */
	explicit PriceSeries(std::vector<PriceSlot> slots);

	const std::vector<PriceSlot> &slots() const {
		return slots_;
	}

	std::size_t size() const {
		return slots_.size();
	}

	bool isEmpty() const {
		return slots_.empty();
	}

	const PriceSlot &operator[](std::size_t index) const {
		return slots_[index];
	}

	/// True when every slot ends exactly where the next one starts.
	bool isContiguous() const;

	/// The common slot span, if all slots share one.
	std::optional<Duration> inferSlotWidth() const;

	/// The slot covering the instant, if any.
	std::optional<PriceSlot> slotAt(const TimePoint &tp) const;

	/**
	 * @brief Clips every slot overlapping the window to the window bounds.
	 * @return Segments in chronological order.
	 */
	std::vector<PriceSegment> clip(const Window &window) const;

	/// Total time inside the window that is covered by slots.
	Duration coverage(const Window &window) const;

private:
	std::vector<PriceSlot> slots_;
};

} // namespace spotwindow::core
