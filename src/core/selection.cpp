#include "spot-window/core/selection.hpp"

#include <algorithm>
#include <stdexcept>

namespace spotwindow::core {

std::string toString(PriceMode mode) {
	switch (mode) {
	case PriceMode::Cheapest:
		return "cheapest";
	case PriceMode::MostExpensive:
		return "most_expensive";
	}
	throw std::invalid_argument("Unknown price mode.");
}

std::string toString(IntervalMode mode) {
	switch (mode) {
	case IntervalMode::Contiguous:
		return "contiguous";
	case IntervalMode::Intermittent:
		return "intermittent";
	}
	throw std::invalid_argument("Unknown interval mode.");
}

std::string toString(SelectionIssue issue) {
	switch (issue) {
	case SelectionIssue::InsufficientCoverage:
		return "insufficient_coverage";
	case SelectionIssue::InfeasibleDuration:
		return "infeasible_duration";
	}
	throw std::invalid_argument("Unknown selection issue.");
}

PriceMode parsePriceMode(const std::string &text) {
	if (text == "cheapest") {
		return PriceMode::Cheapest;
	}
	if (text == "most_expensive") {
		return PriceMode::MostExpensive;
	}
	throw std::invalid_argument("Invalid price mode '" + text + "'.");
}

IntervalMode parseIntervalMode(const std::string &text) {
	if (text == "contiguous") {
		return IntervalMode::Contiguous;
	}
	if (text == "intermittent") {
		return IntervalMode::Intermittent;
	}
	throw std::invalid_argument("Invalid interval mode '" + text + "'.");
}

bool SelectionResult::hasIssue(SelectionIssue issue) const {
	return std::find(issues.begin(), issues.end(), issue) != issues.end();
}

void SelectionResult::addIssue(SelectionIssue issue) {
	if (!hasIssue(issue)) {
		issues.push_back(issue);
	}
}

std::optional<double> SelectionResult::meanPrice() const {
	const double hours = toHours(selected);
	if (hours <= 0.0) {
		return std::nullopt;
	}
	return total_cost / hours;
}

bool SelectionResult::isActive(const TimePoint &now) const {
	return std::any_of(intervals.begin(), intervals.end(),
	                   [&](const SelectedInterval &interval) { return interval.contains(now); });
}

std::vector<SelectedInterval> SelectionResult::chronological() const {
	auto sorted = intervals;
	std::stable_sort(sorted.begin(), sorted.end(),
	                 [](const SelectedInterval &lhs, const SelectedInterval &rhs) { return lhs.start < rhs.start; });
	return sorted;
}

} // namespace spotwindow::core
