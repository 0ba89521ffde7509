#include "spot-window/sensor/spot_sensor.hpp"

#include "spot-window/selectors/selector_factory.hpp"
#include "spot-window/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace spotwindow::sensor {

namespace {

void consider(std::optional<core::TimePoint> &earliest, const core::TimePoint &candidate, const core::TimePoint &now) {
	if (candidate > now && (!earliest || candidate < *earliest)) {
		earliest = candidate;
	}
}

} // namespace

void SensorConfig::validate() const {
	if (duration && *duration < core::Duration::zero()) {
		throw std::invalid_argument("Duration must be non-negative.");
	}
	if (!duration && !duration_signal) {
		throw std::invalid_argument("Either a static duration or a duration signal must be configured.");
	}
	if (name.empty()) {
		throw std::invalid_argument("Sensor name must not be empty.");
	}
}

std::string toString(SensorState state) {
	switch (state) {
	case SensorState::On:
		return "on";
	case SensorState::Off:
		return "off";
	case SensorState::Unavailable:
		return "unavailable";
	}
	throw std::invalid_argument("Unknown sensor state.");
}

// --- Sensor Implementation ---

SpotSensor::SpotSensor(SensorConfig config)
    : config_(std::move(config)), window_resolver_(config_.zone), selector_(selectors::makeSelector(config_.interval_mode)) {
	config_.validate();
}

void SpotSensor::setPrices(std::vector<core::PriceSlot> slots) {
	pending_prices_ = std::move(slots);
	prices_received_ = true;
}

void SpotSensor::setPriceRecords(const std::vector<PriceRecord> &records) {
	std::vector<core::PriceSlot> slots;
	slots.reserve(records.size());
	try {
		for (const auto &record : records) {
			slots.push_back(core::PriceSlot::fromRecord(record.start, record.end, record.fields));
		}
	} catch (const std::invalid_argument &error) {
		SPOTWINDOW_ERROR("Invalid price data for \"{}\": {}", config_.name, error.what());
		slots.clear();
	}
	setPrices(std::move(slots));
}

void SpotSensor::setDurationSignal(resolvers::DurationSignal signal) {
	signal_ = std::move(signal);
}

SensorSnapshot SpotSensor::unavailable(const std::string &reason) const {
	SPOTWINDOW_WARN("\"{}\" is unavailable: {}", config_.name, reason);
	return SensorSnapshot{};
}

const SensorSnapshot &SpotSensor::update(const core::TimePoint &now) {
	try {
		cache_.merge(pending_prices_.value_or(std::vector<core::PriceSlot>{}), now);
	} catch (const std::invalid_argument &error) {
		SPOTWINDOW_ERROR("Discarding price update for \"{}\": {}", config_.name, error.what());
	}
	pending_prices_.reset();

	if (!prices_received_) {
		snapshot_ = unavailable("no price data received yet");
		return snapshot_;
	}

	const auto window = window_resolver_.resolveAt(config_.earliest_start, config_.latest_end, now);

	std::optional<resolvers::DurationSignal> signal;
	if (config_.duration_signal) {
		signal = signal_.value_or(resolvers::DurationSignal{});
	}
	const auto resolution = duration_resolver_.resolve(config_.duration, signal, window, now);
	if (!resolution) {
		snapshot_ = unavailable("no usable duration");
		return snapshot_;
	}

	const core::Window effective{resolution->interval_start, window.end};
	auto selection = selector_->select(effective, cache_.series(), resolution->duration, config_.price_mode);

	// Look one day ahead when the window spans at most a day, so tomorrow's
	// schedule is visible as soon as its prices are.
	std::optional<core::Window> next;
	try {
		next = window_resolver_.nextDay(config_.earliest_start, config_.latest_end, window);
	} catch (const resolvers::InvalidWindowError &error) {
		SPOTWINDOW_WARN("Skipping next-day schedule for \"{}\": {}", config_.name, error.what());
	}
	if (next && next->start >= window.end) {
		const auto lookahead = selector_->select(*next, cache_.series(), resolution->duration, config_.price_mode);
		if (!lookahead.empty() && !lookahead.incomplete()) {
			selection.intervals.insert(selection.intervals.end(), lookahead.intervals.begin(), lookahead.intervals.end());
			selection.selected += lookahead.selected;
			selection.total_cost += lookahead.total_cost;
		}
	}

	state::EvaluationContext context;
	context.earliest_start = config_.earliest_start;
	context.latest_end = config_.latest_end;
	context.duration = resolution->duration;
	context.interval_start = resolution->interval_start;
	context.price_mode = config_.price_mode;
	context.interval_mode = config_.interval_mode;

	const auto evaluated = state::evaluate(selection, window, now, context);

	SensorSnapshot snapshot;
	snapshot.state = evaluated.active ? SensorState::On : SensorState::Off;
	snapshot.attributes = evaluated.attributes;
	snapshot_ = std::move(snapshot);

	if (evaluated.attributes.incomplete) {
		SPOTWINDOW_INFO("\"{}\" selected {} of {} with incomplete price data.", config_.name,
		                core::formatDuration(selection.selected), core::formatDuration(resolution->duration));
	}
	SPOTWINDOW_DEBUG("\"{}\" evaluated at {}: {}.", config_.name, config_.zone.formatIso(now),
	                 toString(snapshot_.state));
	return snapshot_;
}

std::optional<core::TimePoint> SpotSensor::nextEvaluation(const core::TimePoint &now) const {
	std::optional<core::TimePoint> earliest;
	if (snapshot_.attributes) {
		const auto &attributes = *snapshot_.attributes;
		consider(earliest, attributes.window.start, now);
		consider(earliest, attributes.window.end, now);
		for (const auto &interval : attributes.intervals) {
			consider(earliest, interval.start, now);
			consider(earliest, interval.end, now);
		}
	}

	const auto &slots = cache_.series().slots();
	const auto upcoming = std::upper_bound(slots.begin(), slots.end(), now,
	                                       [](const core::TimePoint &value, const core::PriceSlot &slot) {
		                                       return value < slot.start;
	                                       });
	if (upcoming != slots.end()) {
		consider(earliest, upcoming->start, now);
	}
	if (const auto current = cache_.series().slotAt(now)) {
		consider(earliest, current->end, now);
	}
	return earliest;
}

// --- Builder Implementation ---

SpotSensorBuilder &SpotSensorBuilder::withName(std::string name) {
	config_.name = std::move(name);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withEarliestStart(const core::TimeOfDay &time_of_day) {
	config_.earliest_start = core::TimeOfDay::of(time_of_day.hour, time_of_day.minute, time_of_day.second);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withEarliestStart(const std::string &time_of_day) {
	config_.earliest_start = core::TimeOfDay::parse(time_of_day);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withLatestEnd(const core::TimeOfDay &time_of_day) {
	config_.latest_end = core::TimeOfDay::of(time_of_day.hour, time_of_day.minute, time_of_day.second);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withLatestEnd(const std::string &time_of_day) {
	config_.latest_end = core::TimeOfDay::parse(time_of_day);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withDuration(core::Duration duration) {
	config_.duration = duration;
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withDurationSignal(bool enabled) {
	config_.duration_signal = enabled;
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withPriceMode(core::PriceMode mode) {
	config_.price_mode = mode;
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withPriceMode(const std::string &mode) {
	config_.price_mode = core::parsePriceMode(mode);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withIntervalMode(core::IntervalMode mode) {
	config_.interval_mode = mode;
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withIntervalMode(const std::string &mode) {
	config_.interval_mode = core::parseIntervalMode(mode);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withTimeZone(core::TimeZone zone) {
	config_.zone = std::move(zone);
	return *this;
}

SpotSensorBuilder &SpotSensorBuilder::withTimeZone(const std::string &posix_rule) {
	config_.zone = core::TimeZone(posix_rule);
	return *this;
}

std::unique_ptr<SpotSensor> SpotSensorBuilder::build() {
	config_.validate();
	SPOTWINDOW_DEBUG("Building sensor \"{}\": {} - {}, {} / {}.", config_.name, config_.earliest_start.toString(),
	                 config_.latest_end.toString(), core::toString(config_.price_mode),
	                 core::toString(config_.interval_mode));
	return std::unique_ptr<SpotSensor>(new SpotSensor(config_));
}

} // namespace spotwindow::sensor
