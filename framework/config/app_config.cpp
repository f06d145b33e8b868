// framework/config/app_config.cpp
#include "app_config.hpp"
#include "logging/logger.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace faultline::framework
{
  namespace
  {
    std::string lower(std::string value)
    {
      std::transform(value.begin(), value.end(), value.begin(),
                     [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return value;
    }

    std::uint64_t parse_size(const std::string& key, const std::string& value)
    {
      std::size_t consumed = 0;
      unsigned long long parsed = 0;
      try
      {
        parsed = std::stoull(value, &consumed);
      }
      catch (const std::exception&)
      {
        consumed = 0;
      }
      if (consumed == 0 || consumed != value.size() || value.front() == '-')
      {
        throw std::invalid_argument(fmt::format("{}: '{}' is not a valid size", key, value));
      }
      return parsed;
    }

    template <typename Parse>
    auto with_key(const std::string& key, Parse&& parse) -> decltype(parse())
    {
      try
      {
        return parse();
      }
      catch (const std::invalid_argument& e)
      {
        throw std::invalid_argument(fmt::format("{}: {}", key, e.what()));
      }
    }

    std::optional<std::string> env(const std::string& name)
    {
      if (const char* value = std::getenv(name.c_str()))
      {
        return std::string(value);
      }
      return std::nullopt;
    }

    const boost::json::string& expect_string(const std::string& key, const boost::json::value& value)
    {
      if (!value.is_string())
      {
        throw std::invalid_argument(fmt::format("{}: expected a string", key));
      }
      return value.get_string();
    }
  }

  bool parse_bool(const std::string& key, const std::string& value)
  {
    const auto v = lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
    {
      return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off")
    {
      return false;
    }
    throw std::invalid_argument(fmt::format("{}: '{}' is not a boolean", key, value));
  }

  AppConfig AppConfig::from_env(const std::string& prefix)
  {
    AppConfig config;
    config.load_env(prefix);
    return config;
  }

  AppConfig AppConfig::from_json(const boost::json::object& object)
  {
    AppConfig config;
    config.load_json(object);
    return config;
  }

  void AppConfig::load_env(const std::string& prefix)
  {
    if (const auto value = env(prefix + "DEBUG"))
    {
      debug = parse_bool(prefix + "DEBUG", *value);
    }
    if (const auto value = env(prefix + "NOISY_EXCEPTIONS"))
    {
      noisy_exceptions = parse_bool(prefix + "NOISY_EXCEPTIONS", *value);
    }
    if (const auto value = env(prefix + "FALLBACK_ERROR_FORMAT"))
    {
      fallback_error_format = with_key(prefix + "FALLBACK_ERROR_FORMAT",
                                       [&] { return parse_error_format(lower(*value)); });
    }
    if (const auto value = env(prefix + "LOOKUP_MODE"))
    {
      lookup_mode = with_key(prefix + "LOOKUP_MODE", [&] { return parse_lookup_mode(lower(*value)); });
    }
    if (const auto value = env(prefix + "BODY_LIMIT"))
    {
      body_limit = parse_size(prefix + "BODY_LIMIT", *value);
    }
    if (const auto value = env(prefix + "LOG_LEVEL"))
    {
      log_level = with_key(prefix + "LOG_LEVEL", [&] { return logging::parse_level(lower(*value)); });
    }
  }

  void AppConfig::load_json(const boost::json::object& object)
  {
    const auto read_bool = [](const std::string& key, const boost::json::value& value)
    {
      if (value.is_bool())
      {
        return value.get_bool();
      }
      return parse_bool(key, std::string(expect_string(key, value)));
    };

    for (const auto& item : object)
    {
      const std::string key(item.key());
      const auto& value = item.value();

      if (key == "debug")
      {
        debug = read_bool(key, value);
      }
      else if (key == "noisy_exceptions")
      {
        noisy_exceptions = read_bool(key, value);
      }
      else if (key == "fallback_error_format")
      {
        fallback_error_format = with_key(key, [&]
        {
          return parse_error_format(lower(std::string(expect_string(key, value))));
        });
      }
      else if (key == "lookup_mode")
      {
        lookup_mode = with_key(key, [&] { return parse_lookup_mode(lower(std::string(expect_string(key, value)))); });
      }
      else if (key == "body_limit")
      {
        if (value.is_int64() && value.get_int64() >= 0)
        {
          body_limit = static_cast<std::uint64_t>(value.get_int64());
        }
        else if (value.is_uint64())
        {
          body_limit = value.get_uint64();
        }
        else
        {
          throw std::invalid_argument(fmt::format("{}: expected a non-negative integer", key));
        }
      }
      else if (key == "log_level")
      {
        log_level = with_key(key, [&] { return logging::parse_level(lower(std::string(expect_string(key, value)))); });
      }
      else
      {
        logging::server_logger()->warn("Ignoring unknown configuration key '{}'", key);
      }
    }
  }
}
