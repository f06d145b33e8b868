#ifndef FAULTLINE_FRAMEWORK_EXCEPTION_FAULT_HANDLER_HPP_
#define FAULTLINE_FRAMEWORK_EXCEPTION_FAULT_HANDLER_HPP_

#include "context/http_context.hpp"
#include <boost/core/demangle.hpp>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace faultline::framework
{
  /**
   * @brief A named callable that renders a response for a fault.
   *
   * The context is null when the fault happened before a request context
   * existed. Returning std::nullopt defers to the built-in default response.
   * The name identifies the handler in double-fault reports; it defaults to the
   * demangled type of the callable.
   */
  class FaultHandler
  {
  public:
    using Result = std::optional<HttpContext::Response>;
    using Callback = std::function<Result(HttpContext*, const std::exception&)>;

    template <typename F, typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, FaultHandler>>>
    FaultHandler(F&& fn, std::string name = {})
      : name_(name.empty() ? boost::core::demangle(typeid(std::decay_t<F>).name()) : std::move(name)),
        callback_(std::forward<F>(fn))
    {
    }

    const std::string& name() const { return name_; }

    Result operator()(HttpContext* ctx, const std::exception& e) const
    {
      return callback_(ctx, e);
    }

    /**
     * @brief Adapts a handler written against a concrete fault type.
     *
     * The registry only hands a fault to a handler registered for the fault's
     * own type or one of its ancestors, so the downcast holds.
     */
    template <typename E, typename F>
    static FaultHandler typed(F fn, std::string name = {})
    {
      static_assert(std::is_base_of_v<std::exception, E>, "fault types must derive from std::exception");
      if (name.empty())
      {
        name = boost::core::demangle(typeid(F).name());
      }
      return FaultHandler([fn = std::move(fn)](HttpContext* ctx, const std::exception& e) -> Result
      {
        return fn(ctx, dynamic_cast<const E&>(e));
      }, std::move(name));
    }

  private:
    std::string name_;
    Callback callback_;
  };
}

#endif // FAULTLINE_FRAMEWORK_EXCEPTION_FAULT_HANDLER_HPP_
