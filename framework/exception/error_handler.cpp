// framework/exception/error_handler.cpp
#include "error_handler.hpp"
#include "exception/faults.hpp"
#include "logging/logger.hpp"
#include "render/responses.hpp"
#include <boost/core/demangle.hpp>
#include <fmt/core.h>
#include <stdexcept>
#include <typeinfo>

namespace faultline::framework
{
  namespace
  {
    constexpr const char* kDefaultHandlerName = "default";
    constexpr const char* kDoubleFaultMessage = "An error occurred while handling an error";
  }

  ErrorHandler::ErrorHandler(const AppConfig& config, std::shared_ptr<const ErrorRenderer> renderer)
    : registry_(config.lookup_mode),
      renderer_(std::move(renderer)),
      debug_(config.debug),
      noisy_exceptions_(config.noisy_exceptions),
      fallback_(config.fallback_error_format)
  {
    if (!renderer_)
    {
      throw std::invalid_argument("ErrorHandler requires a renderer");
    }
  }

  std::string ErrorHandler::url_of(const HttpContext* ctx)
  {
    if (ctx == nullptr)
    {
      return "unknown";
    }
    return ctx->url().value_or("unknown");
  }

  HttpContext::Response ErrorHandler::respond(HttpContext* ctx, const std::exception& e)
  {
    // names whatever is running when a second fault escapes
    std::string running = kDefaultHandlerName;
    try
    {
      const std::optional<std::string> route_name = ctx != nullptr ? ctx->route_name() : std::nullopt;

      FaultHandler::Result response;
      if (const auto handler = registry_.resolve(e, route_name))
      {
        running = handler->name();
        response = (*handler)(ctx, e);
      }
      if (!response)
      {
        running = kDefaultHandlerName;
        response = default_response(ctx, e);
      }
      return std::move(*response);
    }
    catch (const std::exception& secondary)
    {
      return contain(ctx, running, &secondary);
    }
    catch (...)
    {
      return contain(ctx, running, nullptr);
    }
  }

  HttpContext::Response ErrorHandler::respond(HttpContext* ctx, std::exception_ptr eptr)
  {
    if (!eptr)
    {
      return respond(ctx, ServerError("Empty fault payload"));
    }
    try
    {
      std::rethrow_exception(eptr);
    }
    catch (const std::exception& e)
    {
      return respond(ctx, e);
    }
    catch (...)
    {
      return respond(ctx, ServerError("Unknown exception"));
    }
  }

  HttpContext::Response ErrorHandler::finish(HttpContext& ctx, Outcome outcome)
  {
    if (outcome.ok())
    {
      return std::move(outcome.response());
    }
    return respond(&ctx, outcome.fault());
  }

  HttpContext::Response ErrorHandler::default_response(HttpContext* ctx, const std::exception& e)
  {
    log(ctx, e);
    return renderer_->render(ctx, e, debug_, fallback_);
  }

  void ErrorHandler::log(const HttpContext* ctx, const std::exception& e) const
  {
    const bool noisy = ctx != nullptr && ctx->config() != nullptr
                         ? ctx->config()->noisy_exceptions
                         : noisy_exceptions_;
    if (is_quiet(e) && !noisy)
    {
      return;
    }
    logging::error_logger()->error("Exception occurred while handling uri: {} ({}: {})", url_of(ctx),
                                   boost::core::demangle(typeid(e).name()), e.what());
  }

  void ErrorHandler::finalize(const std::optional<ErrorFormat> fallback)
  {
    if (fallback && *fallback != ErrorFormat::Auto && fallback_ == ErrorFormat::Auto)
    {
      fallback_ = *fallback;
    }
  }

  HttpContext::Response ErrorHandler::contain(const HttpContext* ctx, const std::string& handler_name,
                                              const std::exception* secondary) const
  {
    std::string message;
    try
    {
      message = fmt::format("Exception raised in exception handler \"{}\" for uri: {}", handler_name, url_of(ctx));
      if (secondary != nullptr)
      {
        logging::error_logger()->error("{} ({}: {})", message, boost::core::demangle(typeid(*secondary).name()),
                                       secondary->what());
      }
      else
      {
        logging::error_logger()->error("{} (non-standard exception)", message);
      }
    }
    catch (const std::exception&)
    {
      // the report is lost, the response still goes out
    }

    try
    {
      return text(debug_ && !message.empty() ? message : kDoubleFaultMessage,
                  boost::beast::http::status::internal_server_error);
    }
    catch (const std::exception&)
    {
      HttpContext::Response res;
      res.result(boost::beast::http::status::internal_server_error);
      return res;
    }
  }
}
