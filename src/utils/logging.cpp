#include "spot-window/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace spotwindow::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("spot-window");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("spot-window");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace spotwindow::utils
