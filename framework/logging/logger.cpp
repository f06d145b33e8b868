// framework/logging/logger.cpp
#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <mutex>
#include <stdexcept>

namespace faultline::framework::logging
{
  namespace
  {
    std::mutex& creation_mutex()
    {
      static std::mutex mutex;
      return mutex;
    }
  }

  std::shared_ptr<spdlog::logger> get(const std::string& name)
  {
    if (auto logger = spdlog::get(name))
    {
      return logger;
    }

    // spdlog refuses to register the same name twice, serialize first use
    std::lock_guard lock(creation_mutex());
    if (auto logger = spdlog::get(name))
    {
      return logger;
    }
    return spdlog::stderr_color_mt(name);
  }

  void set_level(const spdlog::level::level_enum level)
  {
    spdlog::set_level(level);
  }

  spdlog::level::level_enum parse_level(const std::string& name)
  {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
    {
      throw std::invalid_argument(fmt::format("Unknown log level '{}'", name));
    }
    return level;
  }
}
