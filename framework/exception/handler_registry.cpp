// framework/exception/handler_registry.cpp
#include "handler_registry.hpp"
#include "exception/faults.hpp"
#include "logging/logger.hpp"
#include <boost/container_hash/hash.hpp>
#include <fmt/core.h>
#include <mutex>
#include <stdexcept>

namespace faultline::framework
{
  LookupMode parse_lookup_mode(const std::string& value)
  {
    if (value == "route_aware")
    {
      return LookupMode::RouteAware;
    }
    if (value == "route_agnostic")
    {
      return LookupMode::RouteAgnostic;
    }
    throw std::invalid_argument(fmt::format("Unknown lookup mode '{}', expected route_aware or route_agnostic", value));
  }

  std::size_t HandlerRegistry::KeyHash::operator()(const Key& key) const noexcept
  {
    std::size_t seed = key.first.hash_code();
    if (key.second)
    {
      boost::hash_combine(seed, *key.second);
    }
    else
    {
      boost::hash_combine(seed, 0x9e3779b9u);
    }
    return seed;
  }

  HandlerRegistry::HandlerRegistry(const LookupMode mode, std::shared_ptr<TypeHierarchy> hierarchy)
    : mode_(mode), hierarchy_(std::move(hierarchy))
  {
    if (!hierarchy_)
    {
      throw std::invalid_argument("HandlerRegistry requires a type hierarchy");
    }
  }

  void HandlerRegistry::add(const std::type_index type, FaultHandler handler,
                            const std::vector<std::string>& route_names)
  {
    const auto entry = std::make_shared<const FaultHandler>(std::move(handler));
    const auto logger = logging::router_logger();

    std::unique_lock lock(mutex_);
    if (route_names.empty() || mode_ == LookupMode::RouteAgnostic)
    {
      if (!route_names.empty())
      {
        logger->warn("Route-agnostic lookup: handler {} for {} registered globally, ignoring {} route scope(s)",
                     entry->name(), boost::core::demangle(type.name()), route_names.size());
      }
      entries_[Key{type, std::nullopt}] = entry;
      logger->debug("Registered fault handler {} for {}", entry->name(), boost::core::demangle(type.name()));
    }
    else
    {
      for (const auto& route : route_names)
      {
        entries_[Key{type, route}] = entry;
        logger->debug("Registered fault handler {} for {} on route {}", entry->name(),
                      boost::core::demangle(type.name()), route);
      }
    }

    cache_.clear();
    ++generation_;
  }

  HandlerRegistry::HandlerPtr HandlerRegistry::resolve(const std::exception& exception,
                                                       const RouteScope& route_name) const
  {
    const std::type_index runtime_type(typeid(exception));
    const RouteScope scope = mode_ == LookupMode::RouteAware ? route_name : std::nullopt;
    const Key key{runtime_type, scope};

    {
      std::shared_lock lock(mutex_);
      if (const auto it = cache_.find(key); it != cache_.end())
      {
        return it->second;
      }
    }

    learn_lineage(exception, runtime_type);

    HandlerPtr handler;
    std::uint64_t generation = 0;
    {
      std::shared_lock lock(mutex_);
      handler = find_handler(runtime_type, scope);
      generation = generation_;
    }

    // concurrent misses on the same key compute the same value, first write wins
    std::unique_lock lock(mutex_);
    if (generation == generation_)
    {
      cache_.emplace(key, handler);
    }
    return handler;
  }

  void HandlerRegistry::learn_lineage(const std::exception& exception, const std::type_index runtime_type) const
  {
    const auto* fault = dynamic_cast<const Fault*>(&exception);
    if (fault == nullptr || hierarchy_->is_declared(runtime_type))
    {
      return;
    }

    try
    {
      // a subclass written without FAULTLINE_DEFINE_FAULT hangs off the nearest class that used it
      if (const auto declared = fault->declare_lineage(*hierarchy_); declared != runtime_type)
      {
        hierarchy_->extend(runtime_type, declared);
      }
    }
    catch (const std::invalid_argument& e)
    {
      logging::router_logger()->warn("Cannot learn the lineage of {}: {}", boost::core::demangle(runtime_type.name()),
                                     e.what());
    }
  }

  HandlerRegistry::HandlerPtr HandlerRegistry::find_entry(const std::type_index type, const RouteScope& scope) const
  {
    if (const auto it = entries_.find(Key{type, scope}); it != entries_.end())
    {
      return it->second;
    }
    return nullptr;
  }

  HandlerRegistry::HandlerPtr HandlerRegistry::find_handler(const std::type_index runtime_type,
                                                            const RouteScope& scope) const
  {
    std::vector<RouteScope> scopes{scope};
    if (scope)
    {
      scopes.emplace_back(std::nullopt);
    }

    for (const auto& name : scopes)
    {
      if (auto handler = find_entry(runtime_type, name))
      {
        return handler;
      }
    }

    const auto chain = hierarchy_->ancestors(runtime_type);
    for (const auto& name : scopes)
    {
      for (const auto& ancestor : chain)
      {
        if (auto handler = find_entry(ancestor, name))
        {
          return handler;
        }
      }
    }
    return nullptr;
  }

  std::size_t HandlerRegistry::entry_count() const
  {
    std::shared_lock lock(mutex_);
    return entries_.size();
  }

  std::size_t HandlerRegistry::cache_size() const
  {
    std::shared_lock lock(mutex_);
    return cache_.size();
  }
}
