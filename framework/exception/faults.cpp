// framework/exception/faults.cpp
#include "faults.hpp"

namespace faultline::framework
{
  Fault::Fault(const std::string& message, const boost::beast::http::status status, const std::optional<bool> quiet)
    : std::runtime_error(message),
      status_(status),
      quiet_(quiet.value_or(status != boost::beast::http::status::internal_server_error))
  {
  }

  void Fault::set_header(const std::string& name, std::string value)
  {
    headers_[name] = std::move(value);
  }

  std::type_index Fault::declare_lineage(TypeHierarchy& hierarchy) const
  {
    hierarchy.declare<Fault>();
    return std::type_index(typeid(Fault));
  }

  boost::beast::http::status status_of(const std::exception& e) noexcept
  {
    if (const auto* fault = dynamic_cast<const Fault*>(&e))
    {
      return fault->status();
    }
    return boost::beast::http::status::internal_server_error;
  }

  bool is_quiet(const std::exception& e) noexcept
  {
    const auto* fault = dynamic_cast<const Fault*>(&e);
    return fault != nullptr && fault->quiet();
  }
}
