#ifndef FAULTLINE_FRAMEWORK_EXCEPTION_TYPE_HIERARCHY_HPP_
#define FAULTLINE_FRAMEWORK_EXCEPTION_TYPE_HIERARCHY_HPP_

#include <exception>
#include <shared_mutex>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace faultline::framework
{
  template <typename T, typename = void>
  struct has_base_type : std::false_type
  {
  };

  template <typename T>
  struct has_base_type<T, std::void_t<typename T::base_type>> : std::true_type
  {
  };

  // False when T picked up base_type from a parent fault instead of naming its
  // own direct base, which would make declare<T>() skip that parent.
  template <typename T, typename = void>
  struct has_own_base_type : std::true_type
  {
  };

  template <typename T>
  struct has_own_base_type<T, std::void_t<typename T::declared_type>>
    : std::bool_constant<std::is_same_v<typename T::declared_type, T> ||
                         std::is_same_v<typename T::base_type, typename T::declared_type>>
  {
  };

  /**
   * @brief Explicit "extends" table over exception types.
   *
   * Ancestor chains are read from declared edges instead of being discovered
   * at runtime. Every chain ends at std::exception, the universal base fault
   * type. The standard exception tree, Boost's system_error and the built-in
   * faults are declared on construction; registering a handler declares its
   * type, and a Fault declares its own lineage the first time it is resolved.
   */
  class TypeHierarchy
  {
  public:
    TypeHierarchy();
    virtual ~TypeHierarchy() = default;

    TypeHierarchy(const TypeHierarchy&) = delete;
    TypeHierarchy& operator=(const TypeHierarchy&) = delete;

    static std::type_index universal_base() { return typeid(std::exception); }

    template <typename T, typename Base>
    void extend()
    {
      static_assert(std::is_base_of_v<Base, T>, "Base must be a base class of T");
      static_assert(std::is_base_of_v<std::exception, Base>, "fault types must derive from std::exception");
      extend(std::type_index(typeid(T)), std::type_index(typeid(Base)));
    }

    /**
     * @brief Declares T and every ancestor reachable through base_type aliases.
     *
     * Types without a base_type alias must already be declared, or be linked with
     * extend(); otherwise their chain falls straight to std::exception.
     */
    template <typename T>
    void declare()
    {
      static_assert(std::is_base_of_v<std::exception, T>, "fault types must derive from std::exception");
      if constexpr (has_base_type<T>::value)
      {
        static_assert(has_own_base_type<T>::value,
                      "fault type inherits base_type from its parent, redeclare it or use FAULTLINE_DEFINE_FAULT");
        using Base = typename T::base_type;
        extend<T, Base>();
        declare<Base>();
      }
    }

    /**
     * @brief Records that `type` directly derives from `parent`.
     * @throws std::invalid_argument if `type` already has another parent, if
     *         `type` is the universal base, or if the edge would close a cycle.
     */
    void extend(std::type_index type, std::type_index parent);

    bool is_declared(std::type_index type) const;

    /**
     * @brief Supertypes of `type`, nearest first, ending with std::exception.
     *
     * `type` itself is not part of the chain. An undeclared type yields just the
     * universal base; the universal base yields an empty chain.
     */
    virtual std::vector<std::type_index> ancestors(std::type_index type) const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::type_index> parents_;
  };
}

#endif // FAULTLINE_FRAMEWORK_EXCEPTION_TYPE_HIERARCHY_HPP_
