#pragma once

#include "spot-window/core/time_zone.hpp"

#include <optional>
#include <string>
#include <vector>

namespace spotwindow::core {

enum class PriceMode {
	Cheapest,
	MostExpensive
};

enum class IntervalMode {
	Contiguous,
	Intermittent
};

enum class SelectionIssue {
	InsufficientCoverage, // price slots leave part of the window uncovered
	InfeasibleDuration    // required duration exceeds the window length
};

std::string toString(PriceMode mode);
std::string toString(IntervalMode mode);
std::string toString(SelectionIssue issue);

/**
 * @brief Parses "cheapest" or "most_expensive".
 * @throws std::invalid_argument On any other value.
 */
PriceMode parsePriceMode(const std::string &text);

/**
 * @brief Parses "contiguous" or "intermittent".
 * @throws std::invalid_argument On any other value.
 */
IntervalMode parseIntervalMode(const std::string &text);

/**
 * @struct SelectedInterval
 * @brief One block of time in which the device should run.
 */
struct SelectedInterval {
	TimePoint start{};
	TimePoint end{};
	std::optional<int> rank; // selection priority, intermittent mode only
	double price = 0.0;      // duration-weighted mean price over the block

	Duration span() const {
		return end - start;
	}

	bool contains(const TimePoint &tp) const {
		return start <= tp && tp < end;
	}
};

/**
 * @struct SelectionResult
 * @brief Output of an interval selector, in selection priority order.
 */
struct SelectionResult {
	std::vector<SelectedInterval> intervals;
	Duration required = Duration::zero();
	Duration selected = Duration::zero();
	double total_cost = 0.0; // sum of price x hours
	std::vector<SelectionIssue> issues;

	bool empty() const {
		return intervals.empty();
	}

	bool incomplete() const {
		return !issues.empty();
	}

	bool hasIssue(SelectionIssue issue) const;
	void addIssue(SelectionIssue issue);

	/// Mean price over the selected time, or nullopt if nothing was selected.
	std::optional<double> meanPrice() const;

	bool isActive(const TimePoint &now) const;

	/// Intervals sorted by start time, ranks preserved.
	std::vector<SelectedInterval> chronological() const;
};

} // namespace spotwindow::core
