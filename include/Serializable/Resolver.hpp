// Resolver.hpp
// (module, qualified name) <-> registered type or function
#pragma once

#include <Serializable/Export.hpp>
#include <Serializable/Registry.hpp>
#include <Serializable/Types.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace Serializable
{

  using ResolvedReference = std::variant<Type, Function>;
  using ExpectedResolved = std::expected<ResolvedReference, Error>;

  struct TypeReference
  {
    // Dotted module path of the declaring module.
    std::string module;
    // Qualified name within the module; dotted for nested types.
    std::string name;

    friend bool operator==(const TypeReference &, const TypeReference &) = default;
  };

  /**
   * Walks module + name segment by segment from the root module. Every
   * intermediate prefix must be a known scope and the full path must name a
   * registered type or function. The first resolution touching a root runs its
   * module initializer. Successful results are cached until ClearResolutionCache().
   */
  [[nodiscard]] SERIALIZABLE_API ExpectedResolved Resolve(std::string_view module, std::string_view qualifiedName);
  [[nodiscard]] SERIALIZABLE_API ExpectedResolved Resolve(const TypeReference &ref);

  [[nodiscard]] SERIALIZABLE_API TypeReference BuildReference(const Type &type);
  [[nodiscard]] SERIALIZABLE_API TypeReference BuildReference(const Function &fn);

  SERIALIZABLE_API void ClearResolutionCache();

} // namespace Serializable
