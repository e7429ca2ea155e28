#pragma once

#include <functional>
#include <initializer_list>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>


#include <Serializable/Export.hpp>
#include <Serializable/Registry.hpp>
#include <Serializable/TypeBuilder.hpp>

namespace Serializable
{

  /**
   * Helper used by module authors to register types and functions under a
   * single dotted module path. Types registered through it default to that
   * module unless their own description overrides it.
   */
  class ModuleRegistration
  {
  public:
    explicit ModuleRegistration(std::string_view moduleName)
        : m_moduleName(moduleName)
    {
    }

    [[nodiscard]] std::string_view ModuleName() const noexcept
    {
      return m_moduleName;
    }

    /** Register a single type. */
    template <class T>
    Type RegisterType() const
    {
      return Type{TypeHandle{detail::EnsureRegistered<T>(m_moduleName)}};
    }

    /** Register multiple types in one call. */
    template <class... T>
    void RegisterTypes() const
    {
      (detail::EnsureRegistered<T>(m_moduleName), ...);
    }

    /** Register a module-level function as ModuleName().name. */
    template <auto Fn>
    ExpectedFunction RegisterFunction(std::string_view name, std::initializer_list<std::string_view> paramNames = {}) const
    {
      return Serializable::RegisterFunction<Fn>(m_moduleName, name, paramNames);
    }

  private:
    std::string m_moduleName;
  };

  namespace detail
  {
    // Guards initializer bookkeeping; recursive so an initializer may resolve other modules.
    SERIALIZABLE_API std::recursive_mutex &ModuleMutex() noexcept;
    SERIALIZABLE_API bool IsModuleInitialized(std::string_view moduleName);
    SERIALIZABLE_API void MarkModuleInitialized(std::string_view moduleName);

    using ModuleInitializer = std::function<bool(ModuleRegistration &)>;
    SERIALIZABLE_API void AddModuleInitializer(std::string_view root, ModuleInitializer fn);
    // Runs the pending initializer for root, if any. Returns whether one was ever registered.
    SERIALIZABLE_API bool RunModuleInitializer(std::string_view root);

    template <class Fn>
    bool InvokeInitializer(Fn &fn, ModuleRegistration &registration)
    {
      using Result = std::invoke_result_t<Fn &, ModuleRegistration &>;
      if constexpr (std::is_void_v<Result>)
      {
        fn(registration);
        return true;
      }
      else if constexpr (std::is_convertible_v<Result, bool>)
      {
        return static_cast<bool>(fn(registration));
      }
      else
      {
        (void)fn(registration);
        return true;
      }
    }
  } // namespace detail

  /**
   * Runs `fn` exactly once per module name and only marks the module as
   * initialized when the callable succeeds. The callable receives a
   * `ModuleRegistration` helper. If it returns a `bool`, that value controls
   * whether initialization is considered successful.
   */
  template <class Fn>
  bool EnsureModuleInitialized(std::string_view moduleName, Fn &&fn)
  {
    std::lock_guard lock{detail::ModuleMutex()};
    if (detail::IsModuleInitialized(moduleName))
      return true;

    ModuleRegistration registration{moduleName};
    if (!detail::InvokeInitializer(fn, registration))
      return false;
    detail::MarkModuleInitialized(moduleName);
    return true;
  }

  /**
   * Defers registration of a root module until the first reference into it is
   * resolved. Runs at most once; a failing initializer is retried on the next
   * resolution.
   */
  template <class Fn>
  void RegisterModuleInitializer(std::string_view root, Fn &&fn)
  {
    detail::AddModuleInitializer(root, [f = std::forward<Fn>(fn)](ModuleRegistration &r) mutable -> bool
                                 { return detail::InvokeInitializer(f, r); });
  }

  /** Runs every pending module initializer now. Returns false if any failed. */
  SERIALIZABLE_API bool EnsureAllModulesInitialized();

} // namespace Serializable
