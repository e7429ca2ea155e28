#include <Serializable/Registry.hpp>
#include <Serializable/TypeBuilder.hpp>

#include <cstdint>
#include <mutex>
#include <string>

namespace Serializable::detail
{

  namespace
  {
    constexpr std::string_view BuiltinsModule = "builtins";

    // Zero-argument and single-value construction, boxed as the native Value.
    template <class T>
    void RegisterBuiltin(std::string_view name)
    {
      TypeBuilder<T> b{EnsureRegistered<T>()};
      b.SetModule(BuiltinsModule).SetName(name).template Constructor<T>().BoxAsValue();
    }
  } // namespace

  void EnsureBuiltinsRegistered()
  {
    static std::once_flag once;
    std::call_once(once,
                   []
                   {
                     RegisterBuiltin<Tuple>("tuple");
                     RegisterBuiltin<List>("list");
                     RegisterBuiltin<Dict>("dict");
                     RegisterBuiltin<std::int64_t>("int");
                     RegisterBuiltin<double>("float");
                     RegisterBuiltin<std::string>("str");
                     RegisterBuiltin<bool>("bool");
                   });
  }

} // namespace Serializable::detail
