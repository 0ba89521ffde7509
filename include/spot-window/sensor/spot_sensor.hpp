#pragma once

#include "spot-window/cache/price_cache.hpp"
#include "spot-window/core/price_series.hpp"
#include "spot-window/core/selection.hpp"
#include "spot-window/core/time_zone.hpp"
#include "spot-window/resolvers/duration_resolver.hpp"
#include "spot-window/resolvers/window_resolver.hpp"
#include "spot-window/selectors/interval_selector.hpp"
#include "spot-window/state/state_evaluator.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spotwindow::sensor {

/**
 * @struct SensorConfig
 * @brief User configuration of one scheduling sensor.
 */
struct SensorConfig {
	std::string name = "spot-window";
	core::TimeOfDay earliest_start;
	core::TimeOfDay latest_end;
	std::optional<core::Duration> duration;
	bool duration_signal = false;
	core::PriceMode price_mode = core::PriceMode::Cheapest;
	core::IntervalMode interval_mode = core::IntervalMode::Contiguous;
	core::TimeZone zone;

	/**
	 * @throws std::invalid_argument If the duration is negative or neither a
	 *         static duration nor a duration signal is configured.
	 */
	void validate() const;
};

/**
 * @struct PriceRecord
 * @brief A provider price entry whose price field name varies by market.
 */
struct PriceRecord {
	core::TimePoint start{};
	core::TimePoint end{};
	std::unordered_map<std::string, double> fields;
};

enum class SensorState {
	On,
	Off,
	Unavailable
};

std::string toString(SensorState state);

struct SensorSnapshot {
	SensorState state = SensorState::Unavailable;
	std::optional<state::Attributes> attributes;

	bool isOn() const {
		return state == SensorState::On;
	}

	bool isAvailable() const {
		return state != SensorState::Unavailable;
	}
};

class SpotSensorBuilder;

/**
 * @class SpotSensor
 * @brief Runs one evaluation cycle: cache prices, resolve window and duration, select, project.
 *
 * Inputs are pushed with setPrices/setPriceRecords/setDurationSignal and take
 * effect on the next update(). update() is cheap and idempotent; hosts call it
 * on new prices, on signal changes and on clock ticks, and may use
 * nextEvaluation() to schedule the next tick.
 */
class SpotSensor {
public:
	friend class SpotSensorBuilder;

	void setPrices(std::vector<core::PriceSlot> slots);

	/**
	 * @brief Converts provider records to slots; invalid records are logged and
	 *        the update is treated as carrying no prices.
	 */
	void setPriceRecords(const std::vector<PriceRecord> &records);

	void setDurationSignal(resolvers::DurationSignal signal);

	const SensorSnapshot &update(const core::TimePoint &now);

	const SensorSnapshot &snapshot() const {
		return snapshot_;
	}

	/// Earliest instant after now at which the sensor state can change.
	std::optional<core::TimePoint> nextEvaluation(const core::TimePoint &now) const;

	const SensorConfig &config() const {
		return config_;
	}

	const core::PriceSeries &prices() const {
		return cache_.series();
	}

	std::string getName() const {
		return config_.name;
	}

private:
	explicit SpotSensor(SensorConfig config);

	SensorSnapshot unavailable(const std::string &reason) const;

	SensorConfig config_;
	resolvers::WindowResolver window_resolver_;
	resolvers::DurationResolver duration_resolver_;
	std::unique_ptr<selectors::IIntervalSelector> selector_;
	cache::PriceCache cache_;

	std::optional<std::vector<core::PriceSlot>> pending_prices_;
	bool prices_received_ = false;
	std::optional<resolvers::DurationSignal> signal_;
	SensorSnapshot snapshot_;
};

/**
 * @class SpotSensorBuilder
 * @brief A builder for fluently configuring and creating SpotSensor instances.
 */
class SpotSensorBuilder {
public:
	SpotSensorBuilder &withName(std::string name);
	SpotSensorBuilder &withEarliestStart(const core::TimeOfDay &time_of_day);
	SpotSensorBuilder &withEarliestStart(const std::string &time_of_day);
	SpotSensorBuilder &withLatestEnd(const core::TimeOfDay &time_of_day);
	SpotSensorBuilder &withLatestEnd(const std::string &time_of_day);
	SpotSensorBuilder &withDuration(core::Duration duration);
	SpotSensorBuilder &withDurationSignal(bool enabled = true);
	SpotSensorBuilder &withPriceMode(core::PriceMode mode);
	SpotSensorBuilder &withPriceMode(const std::string &mode);
	SpotSensorBuilder &withIntervalMode(core::IntervalMode mode);
	SpotSensorBuilder &withIntervalMode(const std::string &mode);
	SpotSensorBuilder &withTimeZone(core::TimeZone zone);
	SpotSensorBuilder &withTimeZone(const std::string &posix_rule);

	/**
	 * @brief Creates the sensor.
	 * @throws std::invalid_argument If the configuration is invalid.
	 */
	std::unique_ptr<SpotSensor> build();

private:
	SensorConfig config_;
};

} // namespace spotwindow::sensor
