#ifndef FAULTLINE_FRAMEWORK_CONFIG_APP_CONFIG_HPP_
#define FAULTLINE_FRAMEWORK_CONFIG_APP_CONFIG_HPP_

#include "exception/handler_registry.hpp"
#include "render/error_renderer.hpp"
#include <boost/json.hpp>
#include <spdlog/common.h>
#include <cstdint>
#include <string>

namespace faultline::framework
{
  /**
   * @brief Application settings consulted while serving requests.
   *
   * Environment variables use the FAULTLINE_ prefix followed by the upper-case
   * key (FAULTLINE_DEBUG, FAULTLINE_NOISY_EXCEPTIONS, ...). JSON objects use the
   * lower-case key. Malformed values throw std::invalid_argument naming the key.
   */
  struct AppConfig
  {
    // expose exception details in rendered errors and double-fault responses
    bool debug = false;
    // log faults even when they are marked quiet
    bool noisy_exceptions = false;
    ErrorFormat fallback_error_format = ErrorFormat::Auto;
    LookupMode lookup_mode = LookupMode::RouteAware;
    std::uint64_t body_limit = 1024 * 1024;
    spdlog::level::level_enum log_level = spdlog::level::info;

    static AppConfig from_env(const std::string& prefix = "FAULTLINE_");
    static AppConfig from_json(const boost::json::object& object);

    // Overrides fields present in the environment / object, leaves the rest.
    void load_env(const std::string& prefix = "FAULTLINE_");
    void load_json(const boost::json::object& object);
  };

  // true/false, 1/0, yes/no, on/off, case-insensitive
  bool parse_bool(const std::string& key, const std::string& value);
}

#endif // FAULTLINE_FRAMEWORK_CONFIG_APP_CONFIG_HPP_
