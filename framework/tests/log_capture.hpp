#ifndef FAULTLINE_FRAMEWORK_TESTS_LOG_CAPTURE_HPP_
#define FAULTLINE_FRAMEWORK_TESTS_LOG_CAPTURE_HPP_

#include "framework/logging/logger.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

// Records everything written to a named logger while in scope.
class LogCapture
{
public:
  explicit LogCapture(const std::string& logger_name = faultline::framework::logging::kErrorLogger)
    : logger_(faultline::framework::logging::get(logger_name)),
      sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)),
      previous_level_(logger_->level())
  {
    sink_->set_pattern("%l %v");
    logger_->sinks().push_back(sink_);
    logger_->set_level(spdlog::level::trace);
  }

  ~LogCapture()
  {
    auto& sinks = logger_->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
    logger_->set_level(previous_level_);
  }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::string str()
  {
    logger_->flush();
    return stream_.str();
  }

  bool empty() { return str().empty(); }

  bool contains(const std::string& needle) { return str().find(needle) != std::string::npos; }

private:
  std::ostringstream stream_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
  spdlog::level::level_enum previous_level_;
};

#endif // FAULTLINE_FRAMEWORK_TESTS_LOG_CAPTURE_HPP_
