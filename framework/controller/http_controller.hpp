// framework/controller/http_controller.hpp
#ifndef FAULTLINE_FRAMEWORK_CONTROLLER_HTTP_CONTROLLER_HPP
#define FAULTLINE_FRAMEWORK_CONTROLLER_HTTP_CONTROLLER_HPP

#include "exception/error_handler.hpp"
#include "router/http_router.hpp"
#include <fmt/core.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace faultline::framework
{
#ifndef FAULTLINE_ROUTE
// Route named "<controller>.<method>", usable as a fault handler scope.
#define FAULTLINE_ROUTE(VERB, PATH, METHOD_NAME) \
this->route(router, boost::beast::http::verb::VERB, PATH, &std::decay_t<decltype(*this)>::METHOD_NAME, #METHOD_NAME)
#endif

  /**
   * @brief A group of routes sharing fault handlers.
   *
   * Handlers registered through exception() apply only to this controller's
   * routes, ahead of global ones.
   */
  template <typename Derived>
  class BaseController : public std::enable_shared_from_this<Derived>
  {
  public:
    explicit BaseController(std::string name) : name_(std::move(name))
    {
    }

    virtual ~BaseController() = default;

    virtual void register_routes(HttpRouter& router) = 0;

    virtual void register_fault_handlers(ErrorHandler& handler)
    {
    }

    // Routes first, so that fault handlers know the scopes they cover.
    std::shared_ptr<Derived> install(HttpRouter& router, ErrorHandler& handler)
    {
      register_routes(router);
      register_fault_handlers(handler);
      return this->shared_from_this();
    }

    const std::string& name() const { return name_; }
    const std::vector<std::string>& route_names() const { return route_names_; }

  protected:
    template <typename MethodPtr>
    void route(HttpRouter& router, const boost::beast::http::verb verb, const std::string& path, MethodPtr method_ptr,
               const std::string& method_name)
    {
      route_names_.push_back(router.add_route(path, verb, bind_handler(method_ptr),
                                              fmt::format("{}.{}", name_, method_name)));
    }

    template <typename E>
    void exception(ErrorHandler& handler, FaultHandler fault_handler)
    {
      if (route_names_.empty())
      {
        throw std::logic_error(fmt::format("Controller {} has no routes to scope fault handlers to", name_));
      }
      handler.add<E>(std::move(fault_handler), route_names_);
    }

    template <typename MethodPtr>
    auto bind_handler(MethodPtr method_ptr)
    {
      return std::bind(method_ptr, this->shared_from_this(), std::placeholders::_1);
    }

  private:
    std::string name_;
    std::vector<std::string> route_names_;
  };
} // namespace faultline::framework

#endif // FAULTLINE_FRAMEWORK_CONTROLLER_HTTP_CONTROLLER_HPP
