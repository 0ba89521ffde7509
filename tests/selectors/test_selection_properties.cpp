#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "spot-window/resolvers/window_resolver.hpp"
#include "spot-window/selectors/selector_factory.hpp"
#include "common/price_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

using spotwindow::core::Duration;
using spotwindow::core::IntervalMode;
using spotwindow::core::PriceMode;
using spotwindow::core::TimeOfDay;
using spotwindow::core::Window;
namespace selectors = spotwindow::selectors;
using tests::helpers::makeHourlySeries;
using tests::helpers::makeSeries;
using tests::helpers::utc;
using namespace std::chrono_literals;

namespace {

const std::vector<std::vector<double>> &priceProfiles() {
	static const std::vector<std::vector<double>> profiles{
	    {42.1, 38.5, 35.0, 33.2, 34.8, 40.0, 55.3, 71.2, 68.9, 60.1, 52.4, 48.0},
	    {5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0},
	    {-3.0, 12.5, -1.0, 80.0, 0.0, 0.0, 7.5, 7.5, 99.9, -20.0, 14.0, 3.3},
	    {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0, 11.0, 12.0},
	};
	return profiles;
}

// Cost of running from a slot boundary for the given duration over hourly prices.
double runCost(const std::vector<double> &prices, std::size_t first, Duration required) {
	double cost = 0.0;
	Duration remaining = required;
	for (std::size_t i = first; i < prices.size() && remaining > Duration::zero(); ++i) {
		const auto take = std::min<Duration>(1h, remaining);
		cost += prices[i] * spotwindow::core::toHours(take);
		remaining -= take;
	}
	return cost;
}

} // namespace

TEST_CASE("Selections never exceed the required duration", "[selectors][properties]") {
	const auto profile = GENERATE(range<std::size_t>(0, 4));
	const auto interval_mode = GENERATE(IntervalMode::Contiguous, IntervalMode::Intermittent);
	const auto price_mode = GENERATE(PriceMode::Cheapest, PriceMode::MostExpensive);
	const auto required = GENERATE(Duration(30min), Duration(1h), Duration(150min), Duration(5h), Duration(11h));

	const auto series = makeHourlySeries(utc(2024, 5, 1), priceProfiles()[profile]);
	const auto window = Window::spanning(utc(2024, 5, 1), utc(2024, 5, 1, 12));
	const auto result = selectors::select(window, series, required, price_mode, interval_mode);

	Duration total = Duration::zero();
	for (const auto &interval : result.intervals) {
		REQUIRE(interval.start >= window.start);
		REQUIRE(interval.end <= window.end);
		REQUIRE(interval.end > interval.start);
		total += interval.span();
	}
	REQUIRE(total == result.selected);
	REQUIRE(total == required);
	REQUIRE_FALSE(result.incomplete());

	if (interval_mode == IntervalMode::Contiguous) {
		REQUIRE(result.intervals.size() == 1);
	} else {
		for (std::size_t i = 0; i < result.intervals.size(); ++i) {
			REQUIRE(result.intervals[i].rank == static_cast<int>(i + 1));
		}
		const auto ordered = result.chronological();
		for (std::size_t i = 1; i < ordered.size(); ++i) {
			REQUIRE(ordered[i].start >= ordered[i - 1].end);
		}
	}
}

TEST_CASE("Contiguous selection is optimal among slot-aligned runs", "[selectors][properties]") {
	const auto profile = GENERATE(range<std::size_t>(0, 4));
	const auto required = GENERATE(Duration(1h), Duration(90min), Duration(3h), Duration(6h));
	const auto &prices = priceProfiles()[profile];

	const auto series = makeHourlySeries(utc(2024, 5, 1), prices);
	const auto window = Window::spanning(utc(2024, 5, 1), utc(2024, 5, 1, 12));
	const auto hours_needed = static_cast<std::size_t>(std::chrono::ceil<std::chrono::hours>(required).count());

	for (auto mode : {PriceMode::Cheapest, PriceMode::MostExpensive}) {
		const auto result = selectors::select(window, series, required, mode, IntervalMode::Contiguous);
		REQUIRE(result.intervals.size() == 1);

		for (std::size_t first = 0; first + hours_needed <= prices.size(); ++first) {
			const double candidate = runCost(prices, first, required);
			if (mode == PriceMode::Cheapest) {
				REQUIRE(result.total_cost <= candidate + 1e-9);
			} else {
				REQUIRE(result.total_cost >= candidate - 1e-9);
			}
		}
	}
}

TEST_CASE("Intermittent selection prefers better prices first", "[selectors][properties]") {
	const auto profile = GENERATE(range<std::size_t>(0, 4));
	const auto series = makeHourlySeries(utc(2024, 5, 1), priceProfiles()[profile]);
	const auto window = Window::spanning(utc(2024, 5, 1), utc(2024, 5, 1, 12));

	const auto cheapest = selectors::select(window, series, 5h, PriceMode::Cheapest, IntervalMode::Intermittent);
	for (std::size_t i = 1; i < cheapest.intervals.size(); ++i) {
		REQUIRE(cheapest.intervals[i - 1].price <= cheapest.intervals[i].price);
	}

	const auto expensive = selectors::select(window, series, 5h, PriceMode::MostExpensive, IntervalMode::Intermittent);
	for (std::size_t i = 1; i < expensive.intervals.size(); ++i) {
		REQUIRE(expensive.intervals[i - 1].price >= expensive.intervals[i].price);
	}

	REQUIRE(cheapest.total_cost <= expensive.total_cost + 1e-9);
}

TEST_CASE("Swapping the price mode changes the selection", "[selectors][properties]") {
	const auto series = makeSeries(utc(2024, 5, 1), 6h, {3.0, 1.0, 4.0, 2.0});
	const auto window = Window::spanning(utc(2024, 5, 1), utc(2024, 5, 2));
	const auto interval_mode = GENERATE(IntervalMode::Contiguous, IntervalMode::Intermittent);

	const auto cheapest = selectors::select(window, series, 6h, PriceMode::Cheapest, interval_mode);
	const auto expensive = selectors::select(window, series, 6h, PriceMode::MostExpensive, interval_mode);
	REQUIRE(cheapest.intervals.front().start != expensive.intervals.front().start);
	REQUIRE(cheapest.meanPrice().value() < expensive.meanPrice().value());
}

TEST_CASE("Selection is deterministic", "[selectors][properties]") {
	const auto series = makeHourlySeries(utc(2024, 5, 1), priceProfiles()[2]);
	const auto window = Window::spanning(utc(2024, 5, 1), utc(2024, 5, 1, 12));
	const auto interval_mode = GENERATE(IntervalMode::Contiguous, IntervalMode::Intermittent);

	const auto first = selectors::select(window, series, 4h, PriceMode::Cheapest, interval_mode);
	const auto second = selectors::select(window, series, 4h, PriceMode::Cheapest, interval_mode);
	REQUIRE(first.intervals.size() == second.intervals.size());
	for (std::size_t i = 0; i < first.intervals.size(); ++i) {
		REQUIRE(first.intervals[i].start == second.intervals[i].start);
		REQUIRE(first.intervals[i].end == second.intervals[i].end);
		REQUIRE(first.intervals[i].rank == second.intervals[i].rank);
	}
}

TEST_CASE("Active exactly while inside a selected interval", "[selectors][properties]") {
	const auto series = makeSeries(utc(2024, 5, 1), 6h, {3.0, 1.0, 4.0, 2.0});
	const auto window = Window::spanning(utc(2024, 5, 1), utc(2024, 5, 2));
	const auto result = selectors::select(window, series, 12h, PriceMode::Cheapest, IntervalMode::Intermittent);

	for (auto now = utc(2024, 5, 1); now < utc(2024, 5, 2); now += 30min) {
		const bool inside = (now >= utc(2024, 5, 1, 6) && now < utc(2024, 5, 1, 12)) || now >= utc(2024, 5, 1, 18);
		REQUIRE(result.isActive(now) == inside);
	}
	REQUIRE_FALSE(result.isActive(utc(2024, 5, 2)));
}

TEST_CASE("Overnight window selects across midnight", "[selectors][properties]") {
	spotwindow::resolvers::WindowResolver resolver;
	const auto window =
	    resolver.resolve(TimeOfDay::of(22, 0), TimeOfDay::of(6, 0), spotwindow::core::LocalDate(2024, 5, 1));
	REQUIRE(window.start == utc(2024, 5, 1, 22));
	REQUIRE(window.end == utc(2024, 5, 2, 6));

	// Hourly prices from 22:00 until 06:00 the next morning.
	const auto series = makeHourlySeries(utc(2024, 5, 1, 22), {9.0, 2.0, 1.0, 9.0, 9.0, 9.0, 9.0, 9.0});

	const auto contiguous = selectors::select(window, series, 2h, PriceMode::Cheapest, IntervalMode::Contiguous);
	REQUIRE(contiguous.intervals.size() == 1);
	REQUIRE(contiguous.intervals[0].start == utc(2024, 5, 1, 23));
	REQUIRE(contiguous.intervals[0].end == utc(2024, 5, 2, 1));
	REQUIRE(contiguous.total_cost == Catch::Approx(3.0));
	REQUIRE(contiguous.isActive(utc(2024, 5, 2, 0, 30)));

	const auto intermittent = selectors::select(window, series, 2h, PriceMode::Cheapest, IntervalMode::Intermittent);
	REQUIRE(intermittent.intervals.size() == 2);
	REQUIRE(intermittent.intervals[0].start == utc(2024, 5, 2, 0));
	REQUIRE(intermittent.intervals[1].start == utc(2024, 5, 1, 23));
	REQUIRE(intermittent.chronological().front().start == utc(2024, 5, 1, 23));
}
