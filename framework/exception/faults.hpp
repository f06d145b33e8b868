#ifndef FAULTLINE_FRAMEWORK_EXCEPTION_FAULTS_HPP_
#define FAULTLINE_FRAMEWORK_EXCEPTION_FAULTS_HPP_

#include "exception/type_hierarchy.hpp"
#include <boost/beast/http/status.hpp>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace faultline::framework
{
  /**
   * @brief Base of every fault raised by the framework and its applications.
   *
   * A fault carries the HTTP status it renders with, a quiet flag that keeps it
   * out of the error log, and headers to add to the rendered response.
   * Subclasses must redeclare base_type and declared_type, which
   * FAULTLINE_DEFINE_FAULT does, so that a fault thrown without ever being
   * registered still finds its ancestors' handlers.
   */
  class Fault : public std::runtime_error
  {
  public:
    using base_type = std::runtime_error;
    using declared_type = Fault;

    // quiet defaults to true for everything but 500
    explicit Fault(const std::string& message,
                   boost::beast::http::status status = boost::beast::http::status::internal_server_error,
                   std::optional<bool> quiet = std::nullopt);

    boost::beast::http::status status() const noexcept { return status_; }
    bool quiet() const noexcept { return quiet_; }

    const std::map<std::string, std::string>& headers() const noexcept { return headers_; }
    void set_header(const std::string& name, std::string value);

    // Declares the most derived fault class that redeclared declared_type and
    // its ancestors, returns that class.
    virtual std::type_index declare_lineage(TypeHierarchy& hierarchy) const;

  private:
    boost::beast::http::status status_;
    bool quiet_;
    std::map<std::string, std::string> headers_;
  };

  // Status of any exception: the fault's own, 500 otherwise.
  boost::beast::http::status status_of(const std::exception& e) noexcept;

  // Quiet flag of any exception: only faults can be quiet.
  bool is_quiet(const std::exception& e) noexcept;
}

#ifndef FAULTLINE_DEFINE_FAULT
#define FAULTLINE_DEFINE_FAULT(NAME, BASE, STATUS, MESSAGE) \
  class NAME : public BASE \
  { \
  public: \
    using base_type = BASE; \
    using declared_type = NAME; \
    explicit NAME(const std::string& message = MESSAGE, std::optional<bool> quiet = std::nullopt) \
      : BASE(message, STATUS, quiet) \
    { \
    } \
    std::type_index declare_lineage(faultline::framework::TypeHierarchy& hierarchy) const override \
    { \
      hierarchy.declare<NAME>(); \
      return std::type_index(typeid(NAME)); \
    } \
  protected: \
    NAME(const std::string& message, boost::beast::http::status status, std::optional<bool> quiet) \
      : BASE(message, status, quiet) \
    { \
    } \
  }
#endif

namespace faultline::framework
{
  FAULTLINE_DEFINE_FAULT(BadRequest, Fault, boost::beast::http::status::bad_request, "Bad Request");
  FAULTLINE_DEFINE_FAULT(HeaderNotFound, BadRequest, boost::beast::http::status::bad_request, "Header Not Found");
  FAULTLINE_DEFINE_FAULT(Unauthorized, Fault, boost::beast::http::status::unauthorized, "Unauthorized");
  FAULTLINE_DEFINE_FAULT(Forbidden, Fault, boost::beast::http::status::forbidden, "Forbidden");
  FAULTLINE_DEFINE_FAULT(NotFound, Fault, boost::beast::http::status::not_found, "Not Found");
  FAULTLINE_DEFINE_FAULT(MethodNotAllowed, Fault, boost::beast::http::status::method_not_allowed,
                         "Method Not Allowed");
  FAULTLINE_DEFINE_FAULT(RequestTimeout, Fault, boost::beast::http::status::request_timeout, "Request Timeout");
  FAULTLINE_DEFINE_FAULT(PayloadTooLarge, Fault, boost::beast::http::status::payload_too_large,
                         "Payload Too Large");
  FAULTLINE_DEFINE_FAULT(ServerError, Fault, boost::beast::http::status::internal_server_error,
                         "Internal Server Error");
  FAULTLINE_DEFINE_FAULT(ServiceUnavailable, Fault, boost::beast::http::status::service_unavailable,
                         "Service Unavailable");
}

#endif // FAULTLINE_FRAMEWORK_EXCEPTION_FAULTS_HPP_
