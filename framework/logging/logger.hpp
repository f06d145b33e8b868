#ifndef FAULTLINE_FRAMEWORK_LOGGING_LOGGER_HPP_
#define FAULTLINE_FRAMEWORK_LOGGING_LOGGER_HPP_

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace faultline::framework::logging
{
  // Fault reports from the dispatch guard.
  inline constexpr const char* kErrorLogger = "faultline.error";
  // Listener lifecycle, acceptor and session I/O.
  inline constexpr const char* kServerLogger = "faultline.server";
  // Route and handler registration.
  inline constexpr const char* kRouterLogger = "faultline.router";

  /**
   * @brief Returns the named logger, creating it with a colour stderr sink on first use.
   */
  std::shared_ptr<spdlog::logger> get(const std::string& name);

  inline std::shared_ptr<spdlog::logger> error_logger() { return get(kErrorLogger); }
  inline std::shared_ptr<spdlog::logger> server_logger() { return get(kServerLogger); }
  inline std::shared_ptr<spdlog::logger> router_logger() { return get(kRouterLogger); }

  // Applies to every registered logger and to loggers created afterwards.
  void set_level(spdlog::level::level_enum level);

  /**
   * @brief Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
   * @throws std::invalid_argument for any other name.
   */
  spdlog::level::level_enum parse_level(const std::string& name);
}

#endif // FAULTLINE_FRAMEWORK_LOGGING_LOGGER_HPP_
