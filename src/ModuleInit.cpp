#include <Serializable/ModuleInit.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace Serializable::detail
{

  namespace
  {
    struct ModuleState
    {
      std::set<std::string, std::less<>> initialized;
      // Root module -> initializer; kept after running so the root stays known.
      std::map<std::string, ModuleInitializer, std::less<>> initializers;
    };

    ModuleState &State()
    {
      static ModuleState state{};
      return state;
    }
  } // namespace

  std::recursive_mutex &ModuleMutex() noexcept
  {
    static std::recursive_mutex mutex;
    return mutex;
  }

  bool IsModuleInitialized(std::string_view moduleName)
  {
    std::lock_guard lock{ModuleMutex()};
    const auto &s = State();
    return s.initialized.find(moduleName) != s.initialized.end();
  }

  void MarkModuleInitialized(std::string_view moduleName)
  {
    std::lock_guard lock{ModuleMutex()};
    State().initialized.emplace(moduleName);
  }

  void AddModuleInitializer(std::string_view root, ModuleInitializer fn)
  {
    std::lock_guard lock{ModuleMutex()};
    State().initializers.insert_or_assign(std::string{root}, std::move(fn));
  }

  bool RunModuleInitializer(std::string_view root)
  {
    std::lock_guard lock{ModuleMutex()};
    auto &s = State();
    auto it = s.initializers.find(root);
    if (it == s.initializers.end())
      return false;
    if (s.initialized.find(root) != s.initialized.end())
      return true;
    ModuleRegistration registration{root};
    if (it->second(registration))
      s.initialized.emplace(root);
    return true;
  }

} // namespace Serializable::detail

namespace Serializable
{

  bool EnsureAllModulesInitialized()
  {
    std::lock_guard lock{detail::ModuleMutex()};
    detail::EnsureBuiltinsRegistered();
    std::vector<std::string> roots;
    for (const auto &entry : detail::State().initializers)
      roots.push_back(entry.first);
    bool ok = true;
    for (const auto &root : roots)
    {
      detail::RunModuleInitializer(root);
      ok = ok && detail::IsModuleInitialized(root);
    }
    return ok;
  }

} // namespace Serializable
