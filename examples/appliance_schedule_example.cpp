#include "spot-window/sensor/spot_sensor.hpp"
#include "spot-window/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace spotwindow;
using namespace std::chrono_literals;

namespace {

const core::TimeZone kCentralEurope("CET-1CEST,M3.5.0/2,M10.5.0/3");

// Day-ahead curve in EUR/MWh with a night valley and a midday solar dip, in
// quarter-hour slots. Daylight-saving days get 92 or 100 slots.
std::vector<sensor::PriceRecord> generateDayAhead(const core::LocalDate &date) {
	std::vector<sensor::PriceRecord> records;
	const auto start = kCentralEurope.combine(date, core::TimeOfDay::of(0, 0));
	const auto end = kCentralEurope.combine(date + boost::gregorian::days(1), core::TimeOfDay::of(0, 0));
	const auto quarters = static_cast<int>((end - start) / 15min);
	for (int quarter = 0; quarter < quarters; ++quarter) {
		const double hour = quarter / 4.0;
		const double base = 95.0 + 35.0 * std::cos((hour - 19.0) * M_PI / 12.0);
		const double solar = hour > 10.0 && hour < 16.0 ? 60.0 * std::sin((hour - 10.0) * M_PI / 6.0) : 0.0;

		sensor::PriceRecord record;
		record.start = start + std::chrono::minutes(15 * quarter);
		record.end = record.start + 15min;
		record.fields["price_eur_per_mwh"] = base - solar;
		records.push_back(record);
	}
	return records;
}

void printSnapshot(const sensor::SpotSensor &appliance, const core::TimePoint &now) {
	const auto &snapshot = appliance.snapshot();
	std::cout << std::setw(14) << appliance.getName() << "  " << kCentralEurope.formatIso(now) << "  "
	          << std::setw(11) << sensor::toString(snapshot.state);

	if (snapshot.attributes && snapshot.attributes->mean_price) {
		std::cout << "  mean " << std::fixed << std::setprecision(2) << *snapshot.attributes->mean_price << " EUR/MWh";
	}
	std::cout << "\n";
}

void printSchedule(const sensor::SpotSensor &appliance) {
	const auto &snapshot = appliance.snapshot();
	if (!snapshot.attributes) {
		std::cout << "  (no schedule)\n";
		return;
	}
	for (const auto &entry : snapshot.attributes->toList(kCentralEurope)) {
		std::cout << "  " << std::left << std::setw(22) << entry.first << std::right << entry.second << "\n";
	}
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	std::cout << "=== Spot price appliance scheduling ===\n\n";

	auto dishwasher = sensor::SpotSensorBuilder()
	                      .withName("dishwasher")
	                      .withEarliestStart("20:00")
	                      .withLatestEnd("07:00")
	                      .withDuration(2h + 30min)
	                      .withIntervalMode(core::IntervalMode::Contiguous)
	                      .withTimeZone(kCentralEurope)
	                      .build();

	auto heat_pump = sensor::SpotSensorBuilder()
	                     .withName("heat_pump")
	                     .withEarliestStart("00:00")
	                     .withLatestEnd("00:00")
	                     .withDurationSignal()
	                     .withIntervalMode(core::IntervalMode::Intermittent)
	                     .withTimeZone(kCentralEurope)
	                     .build();

	auto battery_export = sensor::SpotSensorBuilder()
	                          .withName("battery_export")
	                          .withEarliestStart("06:00")
	                          .withLatestEnd("22:00")
	                          .withDuration(90min)
	                          .withPriceMode(core::PriceMode::MostExpensive)
	                          .withIntervalMode(core::IntervalMode::Intermittent)
	                          .withTimeZone(kCentralEurope)
	                          .build();

	std::vector<sensor::SpotSensor *> sensors{dishwasher.get(), heat_pump.get(), battery_export.get()};

	const core::LocalDate today(2024, 10, 26);
	auto prices = generateDayAhead(today);
	const auto tomorrow = generateDayAhead(today + boost::gregorian::days(1));
	prices.insert(prices.end(), tomorrow.begin(), tomorrow.end());

	for (auto *appliance : sensors) {
		appliance->setPriceRecords(prices);
	}
	heat_pump->setDurationSignal(resolvers::DurationSignal{5.0, "h", std::nullopt});

	std::cout << "Hourly evaluation (" << kCentralEurope.rule() << ")\n";
	std::cout << std::string(78, '-') << "\n";

	auto now = kCentralEurope.combine(today, core::TimeOfDay::of(18, 0));
	const auto until = kCentralEurope.combine(today + boost::gregorian::days(1), core::TimeOfDay::of(9, 0));
	while (now <= until) {
		if (now == kCentralEurope.combine(today, core::TimeOfDay::of(23, 0))) {
			// Thermostat asks for more heating late in the evening.
			heat_pump->setDurationSignal(resolvers::DurationSignal{7.0, "h", now});
		}
		for (auto *appliance : sensors) {
			appliance->update(now);
			printSnapshot(*appliance, now);
		}
		const auto next = dishwasher->nextEvaluation(now);
		std::cout << "  next dishwasher change: " << (next ? kCentralEurope.formatIso(*next) : std::string("none"))
		          << "\n";
		now += 1h;
	}

	std::cout << "\nCurrent schedules\n";
	std::cout << std::string(78, '-') << "\n";
	for (auto *appliance : sensors) {
		std::cout << appliance->getName() << ":\n";
		printSchedule(*appliance);
		std::cout << "\n";
	}

	return 0;
}
