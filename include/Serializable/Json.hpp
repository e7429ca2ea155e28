// Json.hpp
// Text codec: Value <-> JSON text
#pragma once

#include <Serializable/Codec.hpp>
#include <Serializable/Export.hpp>
#include <Serializable/Types.hpp>
#include <Serializable/Value.hpp>
#include <Serializable/ValueTraits.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <type_traits>

namespace Serializable
{

  // Compact JSON text; invalid UTF-8 is replaced and non-finite floats print as null.
  [[nodiscard]] SERIALIZABLE_API std::string JsonPrint(const Ir &ir);
  [[nodiscard]] SERIALIZABLE_API ExpectedIr JsonParse(std::string_view text);

  [[nodiscard]] SERIALIZABLE_API std::expected<std::string, Error> ToJson(const Value &value);
  [[nodiscard]] SERIALIZABLE_API ExpectedValue FromJson(std::string_view text);

  template <class T>
  requires(!std::is_convertible_v<const T &, Value>)
  [[nodiscard]] std::expected<std::string, Error> ToJson(const T &value)
  {
    return ToJson(ValueTraits<T>::ToValue(value));
  }

  template <class T>
  [[nodiscard]] std::expected<T, Error> FromJson(std::string_view text)
  {
    auto v = FromJson(text);
    if (!v)
      return std::unexpected(v.error());
    return ValueTraits<T>::FromValue(*v);
  }

} // namespace Serializable
