// Types.hpp
// Public-facing error codes and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <Serializable/Export.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace Serializable
{

  using Any = NGIN::Utilities::Any<>;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    // A (module, name) pair does not name a registered type or function.
    Resolution = 3,
    // The callable captures enclosing state.
    UnserializableClosure = 4,
    // The callable is not a registered module-level function.
    UnserializableCallable = 5,
    // The object exposes neither a to-mapping nor a field-record capability.
    UnencodableValue = 6,
    MalformedRepresentation = 7,
    Reconstruction = 8,
  };

  [[nodiscard]] SERIALIZABLE_API std::string_view ErrorCodeName(ErrorCode code) noexcept;

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
  };

  // Small opaque handles (indices into the registry tables).
  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  struct FieldHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 fieldIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && fieldIndex != static_cast<NGIN::UInt32>(-1); }
  };

  struct ConstructorHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 ctorIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && ctorIndex != static_cast<NGIN::UInt32>(-1); }
  };

  struct FunctionHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  // Forward decls of high-level wrappers
  class Type;
  class Field;
  class Constructor;
  class Function;
  class Value;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedField = std::expected<Field, Error>;
  using ExpectedFunction = std::expected<Function, Error>;
  using ExpectedValue = std::expected<Value, Error>;

} // namespace Serializable
