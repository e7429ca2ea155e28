#include <Serializable/Resolver.hpp>
#include <Serializable/ModuleInit.hpp>
#include <Serializable/NameUtils.hpp>

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Serializable
{

  namespace
  {
    std::unordered_map<std::string, ResolvedReference> &Cache()
    {
      static std::unordered_map<std::string, ResolvedReference> cache;
      return cache;
    }

    std::string CacheKey(std::string_view module, std::string_view name)
    {
      std::string key{module};
      key.push_back('\x1f');
      key.append(name);
      return key;
    }

    Error ResolutionError(std::string_view module, std::string_view name, std::string_view why)
    {
      std::string msg{"cannot resolve '"};
      msg.append(module);
      msg.push_back(':');
      msg.append(name);
      msg.append("': ");
      msg.append(why);
      return Error{ErrorCode::Resolution, std::move(msg)};
    }

    ExpectedResolved Walk(std::string_view module, std::string_view name)
    {
      if (module.empty() || name.empty())
        return std::unexpected(ResolutionError(module, name, "empty module or name"));

      std::vector<std::string_view> segments = detail::SplitPath(module);
      for (auto s : detail::SplitPath(name))
        segments.push_back(s);
      for (auto s : segments)
      {
        if (s.empty())
          return std::unexpected(ResolutionError(module, name, "empty path segment"));
      }

      const auto root = segments[0];
      const bool hasInitializer = detail::RunModuleInitializer(root);
      if (!hasInitializer && !detail::IsKnownScope(root))
        return std::unexpected(ResolutionError(module, name, "unknown module '" + std::string{root} + "'"));

      std::string path{root};
      for (std::size_t i = 1; i < segments.size(); ++i)
      {
        const std::string parent = path;
        path.push_back('.');
        path.append(segments[i]);
        if (i + 1 < segments.size() && !detail::IsKnownScope(path))
          return std::unexpected(
              ResolutionError(module, name, "'" + parent + "' has no member '" + std::string{segments[i]} + "'"));
      }

      if (auto t = FindType(path))
        return ResolvedReference{*t};
      if (auto f = FindFunction(path))
        return ResolvedReference{*f};
      return std::unexpected(ResolutionError(module, name, "'" + path + "' is not a registered type or function"));
    }
  } // namespace

  ExpectedResolved Resolve(std::string_view module, std::string_view qualifiedName)
  {
    std::lock_guard lock{detail::ModuleMutex()};
    detail::EnsureBuiltinsRegistered();
    auto &cache = Cache();
    auto key = CacheKey(module, qualifiedName);
    if (auto it = cache.find(key); it != cache.end())
      return it->second;

    auto resolved = Walk(module, qualifiedName);
    if (resolved)
      cache.emplace(std::move(key), *resolved);
    return resolved;
  }

  ExpectedResolved Resolve(const TypeReference &ref)
  {
    return Resolve(ref.module, ref.name);
  }

  TypeReference BuildReference(const Type &type)
  {
    return TypeReference{std::string{type.ModuleName()}, std::string{type.Name()}};
  }

  TypeReference BuildReference(const Function &fn)
  {
    return TypeReference{std::string{fn.ModuleName()}, std::string{fn.Name()}};
  }

  void ClearResolutionCache()
  {
    std::lock_guard lock{detail::ModuleMutex()};
    Cache().clear();
  }

} // namespace Serializable
