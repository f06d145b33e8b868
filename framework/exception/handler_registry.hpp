#ifndef FAULTLINE_FRAMEWORK_EXCEPTION_HANDLER_REGISTRY_HPP_
#define FAULTLINE_FRAMEWORK_EXCEPTION_HANDLER_REGISTRY_HPP_

#include "exception/fault_handler.hpp"
#include "exception/type_hierarchy.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace faultline::framework
{
  enum class LookupMode
  {
    RouteAware,
    RouteAgnostic // route scopes are ignored on both registration and resolution
  };

  // "route_aware" or "route_agnostic", throws std::invalid_argument otherwise
  LookupMode parse_lookup_mode(const std::string& value);

  /**
   * @brief Maps (fault type, route scope) to a handler and resolves faults
   * against it with hierarchy fallback and memoization.
   *
   * Resolution order for a fault of runtime type T raised on route R:
   * (T, R), (T, global), ancestors of T under R nearest first, ancestors of T
   * globally nearest first, then no handler. Every outcome, absence included,
   * is cached under (T, R).
   *
   * Registration belongs to setup. add() clears the cache, so a handler added
   * late is never hidden behind a previously cached miss, at the price of
   * recomputing every key once more.
   */
  class HandlerRegistry
  {
  public:
    using HandlerPtr = std::shared_ptr<const FaultHandler>;
    using RouteScope = std::optional<std::string>;

    explicit HandlerRegistry(LookupMode mode = LookupMode::RouteAware,
                             std::shared_ptr<TypeHierarchy> hierarchy = std::make_shared<TypeHierarchy>());

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    /**
     * @brief Registers `handler` for E, once per route name or globally when
     * `route_names` is empty. E's ancestors are declared in the hierarchy.
     */
    template <typename E>
    void add(FaultHandler handler, const std::vector<std::string>& route_names = {})
    {
      static_assert(std::is_base_of_v<std::exception, E>, "fault types must derive from std::exception");
      hierarchy_->declare<E>();
      add(std::type_index(typeid(E)), std::move(handler), route_names);
    }

    void add(std::type_index type, FaultHandler handler, const std::vector<std::string>& route_names = {});

    // Registers a handler taking the concrete fault type.
    template <typename E, typename F>
    void on(F fn, const std::vector<std::string>& route_names = {}, std::string name = {})
    {
      add<E>(FaultHandler::typed<E>(std::move(fn), std::move(name)), route_names);
    }

    /**
     * @brief Best handler for `exception` raised on `route_name`.
     * @return the handler, or nullptr when nothing matches. Absence is a normal
     *         outcome and is cached like any other.
     */
    HandlerPtr resolve(const std::exception& exception, const RouteScope& route_name) const;

    LookupMode mode() const { return mode_; }
    TypeHierarchy& hierarchy() { return *hierarchy_; }
    const TypeHierarchy& hierarchy() const { return *hierarchy_; }

    std::size_t entry_count() const;
    std::size_t cache_size() const;

  private:
    using Key = std::pair<std::type_index, RouteScope>;

    struct KeyHash
    {
      std::size_t operator()(const Key& key) const noexcept;
    };

    // Declares the lineage of a Fault whose runtime type the hierarchy has not seen.
    void learn_lineage(const std::exception& exception, std::type_index runtime_type) const;

    // caller holds mutex_
    HandlerPtr find_entry(std::type_index type, const RouteScope& scope) const;
    HandlerPtr find_handler(std::type_index runtime_type, const RouteScope& scope) const;

    const LookupMode mode_;
    std::shared_ptr<TypeHierarchy> hierarchy_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, HandlerPtr, KeyHash> entries_;
    mutable std::unordered_map<Key, HandlerPtr, KeyHash> cache_;
    std::uint64_t generation_ = 0;
  };
}

#endif // FAULTLINE_FRAMEWORK_EXCEPTION_HANDLER_REGISTRY_HPP_
