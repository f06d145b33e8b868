#ifndef FAULTLINE_FRAMEWORK_EXCEPTION_ERROR_HANDLER_HPP_
#define FAULTLINE_FRAMEWORK_EXCEPTION_ERROR_HANDLER_HPP_

#include "config/app_config.hpp"
#include "context/http_context.hpp"
#include "exception/handler_registry.hpp"
#include "exception/outcome.hpp"
#include "render/error_renderer.hpp"
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace faultline::framework
{
  /**
   * @brief Terminal boundary for faults raised while serving a request.
   *
   * Resolves a handler through the owned HandlerRegistry, invokes it and falls
   * back to default_response() when there is none or it declines. Nothing
   * thrown by a handler, or by the default path, leaves respond(): it is
   * logged and answered with a locally built 500.
   *
   * Subclass and override default_response() to observe unresolved faults.
   */
  class ErrorHandler
  {
  public:
    explicit ErrorHandler(const AppConfig& config = {},
                          std::shared_ptr<const ErrorRenderer> renderer = std::make_shared<ExceptionRenderer>());
    virtual ~ErrorHandler() = default;

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    template <typename E>
    void add(FaultHandler handler, const std::vector<std::string>& route_names = {})
    {
      registry_.add<E>(std::move(handler), route_names);
    }

    template <typename E, typename F>
    void on(F fn, const std::vector<std::string>& route_names = {}, std::string name = {})
    {
      registry_.on<E>(std::move(fn), route_names, std::move(name));
    }

    HandlerRegistry& registry() { return registry_; }
    const HandlerRegistry& registry() const { return registry_; }

    /**
     * @brief Renders the response for `e`. Never throws.
     * @param ctx The request context, null when no request is available.
     */
    HttpContext::Response respond(HttpContext* ctx, const std::exception& e);

    // Unwraps a captured fault; non-standard payloads become ServerError.
    HttpContext::Response respond(HttpContext* ctx, std::exception_ptr eptr);

    // The single place where a routed outcome becomes the response to send.
    HttpContext::Response finish(HttpContext& ctx, Outcome outcome);

    /**
     * @brief Built-in response for faults without a handler: logs the fault and
     * renders it in the configured fallback format.
     */
    virtual HttpContext::Response default_response(HttpContext* ctx, const std::exception& e);

    /**
     * @brief Logs `e` on the error logger with the best-effort request URL,
     * unless it is quiet and noisy exceptions are off.
     *
     * The request's application config decides noisiness, the handler's own
     * config is used when there is no request.
     */
    void log(const HttpContext* ctx, const std::exception& e) const;

    // Adopts `fallback` when it is explicit and the handler is still on auto.
    void finalize(std::optional<ErrorFormat> fallback);

    bool debug() const { return debug_; }
    void set_debug(bool debug) { debug_ = debug; }
    ErrorFormat fallback() const { return fallback_; }

    static std::string url_of(const HttpContext* ctx);

  private:
    HttpContext::Response contain(const HttpContext* ctx, const std::string& handler_name,
                                  const std::exception* secondary) const;

    HandlerRegistry registry_;
    std::shared_ptr<const ErrorRenderer> renderer_;
    bool debug_;
    bool noisy_exceptions_;
    ErrorFormat fallback_;
  };
}

#endif // FAULTLINE_FRAMEWORK_EXCEPTION_ERROR_HANDLER_HPP_
