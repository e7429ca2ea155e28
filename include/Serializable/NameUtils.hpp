// NameUtils.hpp
// Name helpers: member names from pointer-to-member constants, type ids, and
// the dotted module paths used on the wire.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace Serializable::detail
{

  template <auto MemberPtr>
  consteval std::string_view MemberNameFromPretty() noexcept
  {
#if defined(_MSC_VER)
    constexpr std::string_view sig = __FUNCSIG__;
    // Example: "std::string_view __cdecl Serializable::detail::MemberNameFromPretty< &Class::member >(void) noexcept"
    constexpr std::string_view key = "< &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(" >", start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#elif defined(__clang__)
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    // Example: "std::string_view Serializable::detail::MemberNameFromPretty() [MemberPtr = &Class::member]"
    constexpr std::string_view key = "[MemberPtr = &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(']', start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#elif defined(__GNUC__)
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    // Example: "consteval std::string_view Serializable::detail::MemberNameFromPretty() [with auto MemberPtr = &Class::member]"
    constexpr std::string_view key = "[with auto MemberPtr = &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(']', start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#else
    return {};
#endif
    // Strip the Class:: prefix to keep only the member identifier.
    auto dc = full.rfind("::");
    if (dc == std::string_view::npos)
      return full;
    return full.substr(dc + 2);
  }

  // FNV-based type id; matches the ids carried by NGIN::Utilities::Any.
  template <class T>
  inline NGIN::UInt64 TypeIdOf()
  {
    auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
    return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
  }

  // Module used for types and functions declared outside any namespace.
  inline constexpr std::string_view DefaultModuleName = "__main__";

  // "Geo::Shapes::Point" -> {"Geo.Shapes", "Point"}; template arguments stay in the name.
  std::pair<std::string, std::string> SplitNativeName(std::string_view nativeName);

  // "a.b" + "c.d" -> "a.b.c.d"
  std::string JoinPath(std::string_view module, std::string_view name);

  // Splits on '.', keeping empty segments so callers can reject them.
  std::vector<std::string_view> SplitPath(std::string_view path);

} // namespace Serializable::detail
