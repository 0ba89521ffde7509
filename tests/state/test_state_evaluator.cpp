#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "spot-window/selectors/selector_factory.hpp"
#include "spot-window/state/state_evaluator.hpp"
#include "common/price_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <string>

using spotwindow::core::IntervalMode;
using spotwindow::core::PriceMode;
using spotwindow::core::SelectionIssue;
using spotwindow::core::SelectionResult;
using spotwindow::core::TimeOfDay;
using spotwindow::core::TimeZone;
using spotwindow::core::Window;
using spotwindow::state::AttributeList;
using spotwindow::state::EvaluationContext;
using spotwindow::state::evaluate;
using tests::helpers::makeSeries;
using tests::helpers::utc;
using namespace std::chrono_literals;

namespace {

Window day() {
	return Window::spanning(utc(2024, 5, 1), utc(2024, 5, 2));
}

EvaluationContext dayContext(IntervalMode interval_mode) {
	EvaluationContext context;
	context.earliest_start = TimeOfDay::of(0, 0);
	context.latest_end = TimeOfDay::of(0, 0);
	context.duration = 12h;
	context.interval_start = utc(2024, 5, 1);
	context.price_mode = PriceMode::Cheapest;
	context.interval_mode = interval_mode;
	return context;
}

SelectionResult daySelection(IntervalMode interval_mode) {
	const auto series = makeSeries(utc(2024, 5, 1), 6h, {3.5, 1.5, 4.5, 2.5});
	return spotwindow::selectors::select(day(), series, 12h, PriceMode::Cheapest, interval_mode);
}

const std::string *valueOf(const AttributeList &list, const std::string &key) {
	const auto it = std::find_if(list.begin(), list.end(), [&](const auto &entry) { return entry.first == key; });
	return it == list.end() ? nullptr : &it->second;
}

} // namespace

TEST_CASE("evaluate reports enabled and active state", "[state]") {
	const auto selection = daySelection(IntervalMode::Intermittent);
	const auto context = dayContext(IntervalMode::Intermittent);

	SECTION("Inside a selected interval") {
		const auto snapshot = evaluate(selection, day(), utc(2024, 5, 1, 7), context);
		REQUIRE(snapshot.enabled);
		REQUIRE(snapshot.active);
		REQUIRE(snapshot.attributes.enabled);
	}

	SECTION("Inside the window but between intervals") {
		const auto snapshot = evaluate(selection, day(), utc(2024, 5, 1, 13), context);
		REQUIRE(snapshot.enabled);
		REQUIRE_FALSE(snapshot.active);
	}

	SECTION("Window bounds are half-open") {
		REQUIRE(evaluate(selection, day(), utc(2024, 5, 1), context).enabled);
		REQUIRE_FALSE(evaluate(selection, day(), utc(2024, 5, 2), context).enabled);
		REQUIRE_FALSE(evaluate(selection, day(), utc(2024, 5, 2), context).active);
		REQUIRE_FALSE(evaluate(selection, day(), utc(2024, 4, 30, 23, 59), context).enabled);
	}
}

TEST_CASE("evaluate fills the attributes", "[state]") {
	const auto selection = daySelection(IntervalMode::Intermittent);
	const auto snapshot = evaluate(selection, day(), utc(2024, 5, 1, 7), dayContext(IntervalMode::Intermittent));
	const auto &attributes = snapshot.attributes;

	REQUIRE(attributes.window == day());
	REQUIRE(attributes.duration == 12h);
	REQUIRE(attributes.interval_start == utc(2024, 5, 1));
	REQUIRE_FALSE(attributes.incomplete);
	REQUIRE(attributes.issues.empty());
	REQUIRE(attributes.mean_price.value() == Catch::Approx(2.0));

	// Chronological, ranks kept.
	REQUIRE(attributes.intervals.size() == 2);
	REQUIRE(attributes.intervals[0].start == utc(2024, 5, 1, 6));
	REQUIRE(attributes.intervals[0].rank == 1);
	REQUIRE(attributes.intervals[1].start == utc(2024, 5, 1, 18));
	REQUIRE(attributes.intervals[1].rank == 2);
}

TEST_CASE("Attributes render as ordered key/value pairs", "[state][attributes]") {
	const auto selection = daySelection(IntervalMode::Intermittent);
	const auto snapshot = evaluate(selection, day(), utc(2024, 5, 1, 7), dayContext(IntervalMode::Intermittent));
	const auto list = snapshot.attributes.toList(TimeZone::utc());

	REQUIRE(list.size() >= 8);
	REQUIRE(list[0].first == "earliest_start_time");
	REQUIRE(list[1].first == "latest_end_time");
	REQUIRE(list[2].first == "duration");
	REQUIRE(list[3].first == "interval_start_time");
	REQUIRE(list[4].first == "price_mode");
	REQUIRE(list[5].first == "interval_mode");
	REQUIRE(list[6].first == "enabled");
	REQUIRE(list[7].first == "incomplete");

	REQUIRE(*valueOf(list, "earliest_start_time") == "00:00:00");
	REQUIRE(*valueOf(list, "duration") == "12:00:00");
	REQUIRE(*valueOf(list, "interval_start_time") == "2024-05-01T00:00:00+00:00");
	REQUIRE(*valueOf(list, "price_mode") == "cheapest");
	REQUIRE(*valueOf(list, "interval_mode") == "intermittent");
	REQUIRE(*valueOf(list, "enabled") == "true");
	REQUIRE(*valueOf(list, "incomplete") == "false");
	REQUIRE(valueOf(list, "mean_price") != nullptr);

	REQUIRE(*valueOf(list, "data[0].start_time") == "2024-05-01T06:00:00+00:00");
	REQUIRE(*valueOf(list, "data[0].end_time") == "2024-05-01T12:00:00+00:00");
	REQUIRE(*valueOf(list, "data[0].rank") == "1");
	REQUIRE(*valueOf(list, "data[0].price") == "1.5");
	REQUIRE(*valueOf(list, "data[1].start_time") == "2024-05-01T18:00:00+00:00");
	REQUIRE(*valueOf(list, "data[1].rank") == "2");
	REQUIRE(*valueOf(list, "data[1].price") == "2.5");
	REQUIRE(valueOf(list, "data[2].start_time") == nullptr);
}

TEST_CASE("Attributes use the configured zone and omit absent values", "[state][attributes]") {
	const TimeZone cet("CET-1CEST,M3.5.0/2,M10.5.0/3");

	SECTION("Contiguous intervals carry no rank") {
		const auto selection = daySelection(IntervalMode::Contiguous);
		const auto snapshot = evaluate(selection, day(), utc(2024, 5, 1, 7), dayContext(IntervalMode::Contiguous));
		const auto list = snapshot.attributes.toList(cet);

		REQUIRE(*valueOf(list, "interval_start_time") == "2024-05-01T02:00:00+02:00");
		REQUIRE(valueOf(list, "data[0].start_time") != nullptr);
		REQUIRE(valueOf(list, "data[0].rank") == nullptr);
	}

	SECTION("Empty selection has no mean price and no data") {
		SelectionResult empty;
		empty.required = 2h;
		empty.addIssue(SelectionIssue::InsufficientCoverage);

		const auto snapshot = evaluate(empty, day(), utc(2024, 5, 1, 7), dayContext(IntervalMode::Contiguous));
		REQUIRE(snapshot.enabled);
		REQUIRE_FALSE(snapshot.active);
		REQUIRE(snapshot.attributes.incomplete);
		REQUIRE_FALSE(snapshot.attributes.mean_price.has_value());

		const auto list = snapshot.attributes.toList(cet);
		REQUIRE(*valueOf(list, "incomplete") == "true");
		REQUIRE(valueOf(list, "mean_price") == nullptr);
		REQUIRE(valueOf(list, "data[0].start_time") == nullptr);
	}
}
