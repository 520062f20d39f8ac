/**
 * @file log.hpp
 * @brief Library logger.
 *
 * canopy logs through a single spdlog logger named CANOPY_LOGGER_NAME. If the
 * host registered a logger under that name (spdlog::register_logger) it is
 * used, otherwise a colour stdout logger is created on first use. A host can
 * also install its own logger with SetLogger().
 */

#ifndef CANOPY_LOG_HPP_
#define CANOPY_LOG_HPP_

#include <memory>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#ifndef CANOPY_LOGGER_NAME
#define CANOPY_LOGGER_NAME "canopy"
#endif

namespace canopy {

namespace detail {

inline std::shared_ptr<spdlog::logger>& LoggerSlot() {
  static std::shared_ptr<spdlog::logger> logger;
  return logger;
}

}  // namespace detail

/** @brief Get the library logger, creating it on first use. */
inline const std::shared_ptr<spdlog::logger>& GetLogger() {
  std::shared_ptr<spdlog::logger>& logger = detail::LoggerSlot();
  if (logger == nullptr) {
    logger = spdlog::get(CANOPY_LOGGER_NAME);
    if (logger == nullptr) {
      logger = spdlog::stdout_color_mt(CANOPY_LOGGER_NAME);
    }
  }
  return logger;
}

/** @brief Replace the library logger (nullptr restores the default). */
inline void SetLogger(std::shared_ptr<spdlog::logger> logger) {
  detail::LoggerSlot() = std::move(logger);
}

/** @brief Set the level of the library logger. */
inline void SetLogLevel(spdlog::level::level_enum level) {
  GetLogger()->set_level(level);
}

}  // namespace canopy

#endif  // CANOPY_LOG_HPP_
