#ifndef FAULTLINE_FRAMEWORK_EXCEPTION_OUTCOME_HPP_
#define FAULTLINE_FRAMEWORK_EXCEPTION_OUTCOME_HPP_

#include "context/http_context.hpp"
#include <exception>
#include <utility>
#include <variant>

namespace faultline::framework
{
  /**
   * @brief Result of running a request through the router: either the response
   * the route produced or the fault it raised.
   *
   * Only ErrorHandler::finish turns a fault payload into a response.
   */
  class Outcome
  {
  public:
    static Outcome success(HttpContext::Response response)
    {
      return Outcome(std::move(response));
    }

    static Outcome failure(std::exception_ptr fault)
    {
      return Outcome(std::move(fault));
    }

    bool ok() const { return std::holds_alternative<HttpContext::Response>(value_); }

    HttpContext::Response& response() { return std::get<HttpContext::Response>(value_); }
    std::exception_ptr fault() const { return std::get<std::exception_ptr>(value_); }

  private:
    explicit Outcome(HttpContext::Response response) : value_(std::move(response))
    {
    }

    explicit Outcome(std::exception_ptr fault) : value_(std::move(fault))
    {
    }

    std::variant<HttpContext::Response, std::exception_ptr> value_;
  };
}

#endif // FAULTLINE_FRAMEWORK_EXCEPTION_OUTCOME_HPP_
