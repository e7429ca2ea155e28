// Registry.hpp
// Process-wide registry of serializable types and module-level functions
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <Serializable/Export.hpp>
#include <Serializable/NameUtils.hpp>
#include <Serializable/Types.hpp>
#include <Serializable/Value.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace Serializable
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace Serializable: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    // Convenience wrappers using the global registry interner
    SERIALIZABLE_API NameId InternNameId(std::string_view s) noexcept;
    SERIALIZABLE_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    SERIALIZABLE_API std::string_view NameFromId(NameId id) noexcept;

    struct FieldRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      Value (*Load)(const void *){nullptr};
      std::expected<void, Error> (*Store)(void *, const Value &){nullptr};
    };

    struct CtorRuntimeDesc
    {
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      // Empty when the constructor only accepts positional arguments.
      NGIN::Containers::Vector<std::string_view> paramNames;
      std::expected<Any, Error> (*Construct)(const Value *, NGIN::UIntSize){nullptr};
    };

    struct FunctionRuntimeDesc
    {
      std::string_view moduleName;
      std::string_view name;
      // module + '.' + name
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 address{0};
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      NGIN::Containers::Vector<std::string_view> paramNames;
      ExpectedValue (*Invoke)(const Value *, NGIN::UIntSize){nullptr};
    };

    struct TypeRuntimeDesc
    {
      // module + '.' + name
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      std::string_view moduleName;
      std::string_view name;
      NGIN::UInt64 typeId{0};
      NGIN::Containers::Vector<FieldRuntimeDesc> fields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> fieldIndex;
      NGIN::Containers::Vector<CtorRuntimeDesc> constructors;
      std::expected<Dict, Error> (*ToFields)(const void *){nullptr};
      std::expected<Any, Error> (*FromFields)(const Dict &){nullptr};
      // Default-construct, then assign every registered field from the mapping.
      std::expected<Any, Error> (*AssignFields)(const Dict &){nullptr};
      bool (*Equals)(const void *, const void *){nullptr};
      // Converts a constructed instance into a Value; null boxes it as an Object.
      Value (*Box)(const Any &){nullptr};
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;
      NGIN::Containers::Vector<FunctionRuntimeDesc> functions;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> functionByName;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> functionByAddress;

      StringInterner names;
    };

    SERIALIZABLE_API Registry &GetRegistry() noexcept;

    // Appends a type record, interning its names and indexing it. Returns the type index.
    SERIALIZABLE_API NGIN::UInt32 AddType(TypeRuntimeDesc &&rec, std::string_view moduleName, std::string_view name);
    // Moves a type to a new (module, name) path; a path already held by a type or function keeps its owner.
    SERIALIZABLE_API void RenameType(NGIN::UInt32 index, std::string_view moduleName, std::string_view name);
    // When module names an already registered type, the pair is rewritten to live inside that type:
    // {"geo.Outer", "Inner"} -> {"geo", "Outer.Inner"}.
    SERIALIZABLE_API void NestUnderEnclosingType(std::string &module, std::string &name);
    SERIALIZABLE_API std::expected<NGIN::UInt32, Error> AddFunction(FunctionRuntimeDesc &&rec, std::string_view moduleName,
                                                                    std::string_view name,
                                                                    std::initializer_list<std::string_view> paramNames);
    SERIALIZABLE_API std::optional<NGIN::UInt32> FindFunctionByAddress(NGIN::UInt64 address) noexcept;

    // True when some registered type or function path starts with "prefix.".
    SERIALIZABLE_API bool IsKnownScope(std::string_view prefix);

    // Registers the "builtins" module (tuple, list, dict, int, float, str, bool) once.
    SERIALIZABLE_API void EnsureBuiltinsRegistered();

    template <class T>
    concept HasSerializableReflect = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void SerializableReflect(Tag<T>, TypeBuilder<T>&)
      { SerializableReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    template <class T>
    concept HasDescribe = requires(TypeBuilder<T> &b) {
      { Serializable::Describe<T>::Do(b) };
    };

    // Traits for pointer-to-member decomposition
    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <class T>
    bool EqualsImpl(const void *a, const void *b)
    {
      return *static_cast<const T *>(a) == *static_cast<const T *>(b);
    }

    // Ensure a type is present; returns the type index.
    // defaultModule overrides the module derived from the C++ namespace.
    template <class T>
    NGIN::UInt32 EnsureRegistered(std::string_view defaultModule = {})
    {
      using U = std::remove_cvref_t<T>;
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.typeId = tid;

      if constexpr (std::is_default_constructible_v<U>)
      {
        CtorRuntimeDesc c{};
        c.Construct = [](const Value *, NGIN::UIntSize cnt) -> std::expected<Any, Error>
        {
          if (cnt != 0)
            return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
          return Any{U{}};
        };
        rec.constructors.PushBack(std::move(c));
      }
      if constexpr (std::equality_comparable<U>)
        rec.Equals = &EqualsImpl<U>;

      const auto nativeName = NGIN::Meta::TypeName<U>::qualifiedName;
      auto [module, name] = SplitNativeName(nativeName);
      if (!defaultModule.empty())
        module = std::string{defaultModule};
      else
        NestUnderEnclosingType(module, name);
      const auto idx = AddType(std::move(rec), module, name);

      if constexpr (HasSerializableReflect<U>)
      {
        TypeBuilder<U> b{idx};
        SerializableReflect(Tag<U>{}, b); // ADL
      }
      else if constexpr (HasDescribe<U>)
      {
        TypeBuilder<U> b{idx};
        Serializable::Describe<U>::Do(b);
      }
      return idx;
    }

  } // namespace detail

  class SERIALIZABLE_API Field
  {
  public:
    constexpr Field() = default;
    explicit constexpr Field(FieldHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;

    [[nodiscard]] Value Load(const void *obj) const;
    [[nodiscard]] std::expected<void, Error> Store(void *obj, const Value &value) const;

  private:
    FieldHandle m_h{};
  };

  class SERIALIZABLE_API Constructor
  {
  public:
    constexpr Constructor() = default;
    explicit constexpr Constructor(ConstructorHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    // Empty when the constructor was registered without parameter names.
    [[nodiscard]] std::string_view ParameterName(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedValue Construct(std::span<const Value> args) const;

  private:
    ConstructorHandle m_h{};
  };

  class SERIALIZABLE_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] TypeHandle Handle() const noexcept { return m_h; }

    // Dotted module path, e.g. "geometry.shapes".
    [[nodiscard]] std::string_view ModuleName() const;
    // Name within the module; may itself be dotted for nested types.
    [[nodiscard]] std::string_view Name() const;
    // ModuleName() + '.' + Name()
    [[nodiscard]] std::string_view QualifiedName() const;

    [[nodiscard]] NGIN::UIntSize FieldCount() const;
    [[nodiscard]] Field FieldAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedField GetField(std::string_view name) const;
    [[nodiscard]] std::optional<Field> FindField(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize ConstructorCount() const;
    [[nodiscard]] Constructor ConstructorAt(NGIN::UIntSize i) const;

    [[nodiscard]] bool HasToFields() const;
    [[nodiscard]] bool HasFromFields() const;

    // Positional construction: the first constructor of matching arity that accepts the arguments.
    [[nodiscard]] ExpectedValue Construct(std::span<const Value> args) const;
    // Keyword construction: a constructor whose parameter names match the keys,
    // else default construction plus assignment of every registered field.
    [[nodiscard]] ExpectedValue ConstructNamed(const Dict &fields) const;
    // Construct-from-mapping capability.
    [[nodiscard]] ExpectedValue FromFieldMapping(const Dict &fields) const;

    // To-mapping capability if present, else the registered fields in registration order.
    [[nodiscard]] std::expected<Dict, Error> FieldMapping(const void *obj) const;
    [[nodiscard]] bool Equals(const void *a, const void *b) const;
    [[nodiscard]] Value Box(const Any &instance) const;

    friend bool operator==(const Type &a, const Type &b) noexcept { return a.m_h.index == b.m_h.index; }

  private:
    TypeHandle m_h{};
  };

  class SERIALIZABLE_API Function
  {
  public:
    constexpr Function() = default;
    explicit constexpr Function(FunctionHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] FunctionHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view ModuleName() const;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    [[nodiscard]] std::string_view ParameterName(NGIN::UIntSize i) const;

    [[nodiscard]] ExpectedValue Invoke(std::span<const Value> args) const;
    [[nodiscard]] ExpectedValue InvokeNamed(const Dict &args) const;

    friend bool operator==(const Function &a, const Function &b) noexcept { return a.m_h.index == b.m_h.index; }

  private:
    FunctionHandle m_h{};
  };

  // Register a module-level function under module.name; defined in TypeBuilder.hpp
  template <auto Fn>
  ExpectedFunction RegisterFunction(std::string_view module, std::string_view name,
                                    std::initializer_list<std::string_view> paramNames = {});

  // Queries by dotted path ("module.Name")
  SERIALIZABLE_API ExpectedType GetType(std::string_view path);
  SERIALIZABLE_API std::optional<Type> FindType(std::string_view path);
  SERIALIZABLE_API ExpectedFunction GetFunction(std::string_view path);
  SERIALIZABLE_API std::optional<Function> FindFunction(std::string_view path);

  template <class T>
  Type GetType()
  {
    return Type{TypeHandle{detail::EnsureRegistered<T>()}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    auto &reg = detail::GetRegistry();
    if (auto *p = reg.byTypeId.GetPtr(detail::TypeIdOf<T>()))
      return Type{TypeHandle{*p}};
    return std::nullopt;
  }

} // namespace Serializable
