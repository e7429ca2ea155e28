// Codec.hpp
// Recursive Value <-> JSON intermediate representation
#pragma once

#include <nlohmann/json.hpp>

#include <Serializable/Export.hpp>
#include <Serializable/Types.hpp>
#include <Serializable/Value.hpp>

#include <expected>

namespace Serializable
{

  // JSON-compatible tree; object members keep insertion order.
  using Ir = nlohmann::ordered_json;
  using ExpectedIr = std::expected<Ir, Error>;

  // Null, booleans, numbers and strings pass through the codec untouched.
  [[nodiscard]] SERIALIZABLE_API bool IsPrimitive(const Ir &ir) noexcept;

  /**
   * Lists become arrays, tuples and objects become tagged IR objects carrying
   * "__class__", dictionaries go through the key codec, classes and registered
   * functions become bare {"__module__", "__name__"} references. Closures and
   * other unregistered callables are rejected.
   */
  [[nodiscard]] SERIALIZABLE_API ExpectedIr Encode(const Value &value);

  /**
   * Inverse of Encode. References are resolved against the registry and tagged
   * objects are reconstructed through the referenced type or function.
   */
  [[nodiscard]] SERIALIZABLE_API ExpectedValue Decode(const Ir &ir);

} // namespace Serializable
