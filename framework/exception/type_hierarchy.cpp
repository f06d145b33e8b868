// framework/exception/type_hierarchy.cpp
#include "type_hierarchy.hpp"
#include "faults.hpp"
#include <boost/core/demangle.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/core.h>
#include <any>
#include <filesystem>
#include <functional>
#include <future>
#include <ios>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <typeinfo>
#include <variant>

namespace faultline::framework
{
  TypeHierarchy::TypeHierarchy()
  {
    extend<std::logic_error, std::exception>();
    extend<std::invalid_argument, std::logic_error>();
    extend<std::domain_error, std::logic_error>();
    extend<std::length_error, std::logic_error>();
    extend<std::out_of_range, std::logic_error>();
    extend<std::runtime_error, std::exception>();
    extend<std::range_error, std::runtime_error>();
    extend<std::overflow_error, std::runtime_error>();
    extend<std::underflow_error, std::runtime_error>();
    extend<std::system_error, std::runtime_error>();
    extend<std::regex_error, std::runtime_error>();
    extend<std::future_error, std::logic_error>();
    extend<std::filesystem::filesystem_error, std::system_error>();
    // the pre-C++11 library ABI still derives ios_base::failure from exception
    if constexpr (std::is_base_of_v<std::system_error, std::ios_base::failure>)
    {
      extend<std::ios_base::failure, std::system_error>();
    }
    else
    {
      extend<std::ios_base::failure, std::exception>();
    }
    extend<std::bad_alloc, std::exception>();
    extend<std::bad_array_new_length, std::bad_alloc>();
    extend<std::bad_cast, std::exception>();
    extend<std::bad_any_cast, std::bad_cast>();
    extend<std::bad_typeid, std::exception>();
    extend<std::bad_exception, std::exception>();
    extend<std::bad_weak_ptr, std::exception>();
    extend<std::bad_function_call, std::exception>();
    extend<std::bad_optional_access, std::exception>();
    extend<std::bad_variant_access, std::exception>();

    // raised by Asio and Beast
    extend<boost::system::system_error, std::runtime_error>();

    declare<HeaderNotFound>();
    declare<Unauthorized>();
    declare<Forbidden>();
    declare<NotFound>();
    declare<MethodNotAllowed>();
    declare<RequestTimeout>();
    declare<PayloadTooLarge>();
    declare<ServerError>();
    declare<ServiceUnavailable>();
  }

  void TypeHierarchy::extend(const std::type_index type, const std::type_index parent)
  {
    if (type == universal_base())
    {
      throw std::invalid_argument("std::exception is the root of every fault hierarchy and has no parent");
    }
    if (type == parent)
    {
      throw std::invalid_argument(fmt::format("{} cannot extend itself", boost::core::demangle(type.name())));
    }

    std::unique_lock lock(mutex_);
    if (const auto it = parents_.find(type); it != parents_.end())
    {
      if (it->second == parent)
      {
        return;
      }
      throw std::invalid_argument(fmt::format("{} already extends {}, cannot also extend {}",
                                              boost::core::demangle(type.name()),
                                              boost::core::demangle(it->second.name()),
                                              boost::core::demangle(parent.name())));
    }

    for (auto it = parents_.find(parent); it != parents_.end(); it = parents_.find(it->second))
    {
      if (it->second == type)
      {
        throw std::invalid_argument(fmt::format("{} extending {} would create a cycle",
                                                boost::core::demangle(type.name()),
                                                boost::core::demangle(parent.name())));
      }
    }

    parents_.emplace(type, parent);
  }

  bool TypeHierarchy::is_declared(const std::type_index type) const
  {
    std::shared_lock lock(mutex_);
    return type == universal_base() || parents_.count(type) > 0;
  }

  std::vector<std::type_index> TypeHierarchy::ancestors(const std::type_index type) const
  {
    std::vector<std::type_index> chain;
    if (type == universal_base())
    {
      return chain;
    }

    std::shared_lock lock(mutex_);
    for (auto it = parents_.find(type); it != parents_.end(); it = parents_.find(it->second))
    {
      chain.push_back(it->second);
      if (it->second == universal_base())
      {
        return chain;
      }
    }

    // broken or missing link, the chain still ends at the universal base
    chain.push_back(universal_base());
    return chain;
  }
}
