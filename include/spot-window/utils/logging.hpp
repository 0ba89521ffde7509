#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace spotwindow::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by spot-window.
 *
 * Every component logs through the same named logger so the hosting
 * application can tune verbosity once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace spotwindow::utils

#define SPOTWINDOW_TRACE(...)    spotwindow::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define SPOTWINDOW_DEBUG(...)    spotwindow::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define SPOTWINDOW_INFO(...)     spotwindow::utils::Logging::getLogger()->info(__VA_ARGS__)
#define SPOTWINDOW_WARN(...)     spotwindow::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define SPOTWINDOW_ERROR(...)    spotwindow::utils::Logging::getLogger()->error(__VA_ARGS__)
#define SPOTWINDOW_CRITICAL(...) spotwindow::utils::Logging::getLogger()->critical(__VA_ARGS__)
