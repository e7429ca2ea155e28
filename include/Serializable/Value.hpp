// Value.hpp
// Dynamic value model: everything the codec can encode and everything it decodes to.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <Serializable/Export.hpp>
#include <Serializable/NameUtils.hpp>
#include <Serializable/Types.hpp>

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Serializable
{

  struct DictEntry;

  enum class ValueKind : NGIN::UInt8
  {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    List,
    Tuple,
    Dict,
    Object,
    Class,
    Function,
    Callable,
  };

  [[nodiscard]] SERIALIZABLE_API std::string_view ValueKindName(ValueKind kind) noexcept;

  // Structural hash: equal values hash equal; Dict hashing ignores entry order.
  [[nodiscard]] SERIALIZABLE_API NGIN::UInt64 HashValue(const Value &value) noexcept;

  // Mutable ordered sequence.
  class SERIALIZABLE_API List
  {
  public:
    List() = default;
    List(std::initializer_list<Value> items);
    explicit List(std::vector<Value> items);

    [[nodiscard]] NGIN::UIntSize Size() const noexcept;
    [[nodiscard]] bool Empty() const noexcept;
    [[nodiscard]] const Value &operator[](NGIN::UIntSize i) const;
    [[nodiscard]] Value &operator[](NGIN::UIntSize i);
    void PushBack(Value v);

    [[nodiscard]] std::span<const Value> Items() const noexcept;
    [[nodiscard]] std::vector<Value>::const_iterator begin() const noexcept;
    [[nodiscard]] std::vector<Value>::const_iterator end() const noexcept;

    friend SERIALIZABLE_API bool operator==(const List &a, const List &b);

  private:
    std::vector<Value> m_items;
  };

  // Fixed-arity ordered sequence.
  class SERIALIZABLE_API Tuple
  {
  public:
    Tuple() = default;
    Tuple(std::initializer_list<Value> items);
    explicit Tuple(std::vector<Value> items);

    [[nodiscard]] NGIN::UIntSize Size() const noexcept;
    [[nodiscard]] const Value &operator[](NGIN::UIntSize i) const;

    [[nodiscard]] std::span<const Value> Items() const noexcept;
    [[nodiscard]] std::vector<Value>::const_iterator begin() const noexcept;
    [[nodiscard]] std::vector<Value>::const_iterator end() const noexcept;

    friend SERIALIZABLE_API bool operator==(const Tuple &a, const Tuple &b);

  private:
    std::vector<Value> m_items;
  };

  // Insertion-ordered mapping with keys of any kind, unique by structural equality.
  class SERIALIZABLE_API Dict
  {
  public:
    Dict() = default;
    Dict(std::initializer_list<std::pair<Value, Value>> entries);
    Dict(const Dict &other);
    Dict(Dict &&) noexcept = default;
    Dict &operator=(const Dict &other);
    Dict &operator=(Dict &&) noexcept = default;

    [[nodiscard]] NGIN::UIntSize Size() const noexcept;
    [[nodiscard]] bool Empty() const noexcept;

    // Replaces the value of an equal key in place, otherwise appends.
    void Insert(Value key, Value value);
    [[nodiscard]] const Value *Find(const Value &key) const;
    [[nodiscard]] bool Contains(const Value &key) const { return Find(key) != nullptr; }
    // Removes the entry and returns its value.
    std::optional<Value> Pop(std::string_view key);

    [[nodiscard]] const DictEntry &EntryAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::vector<DictEntry>::const_iterator begin() const noexcept;
    [[nodiscard]] std::vector<DictEntry>::const_iterator end() const noexcept;

    // Order-insensitive, like a mapping comparison.
    friend SERIALIZABLE_API bool operator==(const Dict &a, const Dict &b);

  private:
    [[nodiscard]] NGIN::UIntSize IndexOf(const Value &key) const;
    void Reindex();

    std::vector<DictEntry> m_entries;
    // Key hash -> entry positions sharing that hash.
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::Containers::Vector<NGIN::UIntSize>> m_index;
  };

  // Instance of a registered type, held by value in a type-erased box.
  class SERIALIZABLE_API Object
  {
  public:
    Object() = default;
    Object(TypeHandle type, Any instance) : m_type(type), m_instance(std::move(instance)) {}

    [[nodiscard]] TypeHandle Handle() const noexcept { return m_type; }
    [[nodiscard]] Type GetType() const;
    [[nodiscard]] const Any &Instance() const noexcept { return m_instance; }
    [[nodiscard]] const void *Data() const noexcept { return m_instance.Data(); }

    // Null when the boxed instance is not a T.
    template <class T>
    [[nodiscard]] const T *TryAs() const noexcept
    {
      if (m_instance.GetTypeId() != detail::TypeIdOf<T>())
        return nullptr;
      return static_cast<const T *>(m_instance.Data());
    }

    friend SERIALIZABLE_API bool operator==(const Object &a, const Object &b);

  private:
    TypeHandle m_type{};
    Any m_instance{};
  };

  enum class CallableKind : NGIN::UInt8
  {
    // Captures enclosing state.
    Closure = 0,
    // Bound to a receiver object.
    BoundMethod = 1,
    // Stateless but not registered under a module path.
    Anonymous = 2,
  };

  struct CallableState;

  // Invocable without a registry identity. Never serializable; kept so that
  // the encoder can reject it with a precise error.
  class SERIALIZABLE_API Callable
  {
  public:
    Callable() = default;
    explicit Callable(std::shared_ptr<const CallableState> state) : m_state(std::move(state)) {}

    [[nodiscard]] CallableKind Kind() const noexcept;
    [[nodiscard]] std::string_view Name() const noexcept;
    [[nodiscard]] ExpectedValue Invoke(std::span<const Value> args) const;

    friend bool operator==(const Callable &a, const Callable &b) noexcept { return a.m_state == b.m_state; }

  private:
    std::shared_ptr<const CallableState> m_state;
  };

  class SERIALIZABLE_API Value
  {
  public:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 List,
                                 Tuple,
                                 Dict,
                                 Object,
                                 TypeHandle,
                                 FunctionHandle,
                                 Callable>;

    Value() = default;
    Value(std::nullptr_t) {}
    template <class T>
    requires std::is_same_v<T, bool>
    Value(T b) : m_data(b)
    {
    }
    template <class T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    Value(T i) : m_data(static_cast<std::int64_t>(i))
    {
    }
    template <class T>
    requires std::is_floating_point_v<T>
    Value(T f) : m_data(static_cast<double>(f))
    {
    }
    Value(const char *s) : m_data(std::string{s}) {}
    Value(std::string_view s) : m_data(std::string{s}) {}
    Value(std::string s) : m_data(std::move(s)) {}
    Value(List l);
    Value(Tuple t);
    Value(Dict d);
    Value(Object o);
    Value(Callable c);

    [[nodiscard]] static Value FromType(const Type &type);
    [[nodiscard]] static Value FromFunction(const Function &fn);

    [[nodiscard]] ValueKind Kind() const noexcept { return static_cast<ValueKind>(m_data.index()); }
    // Null, bool, int, float and string travel through the codec untouched.
    [[nodiscard]] bool IsPrimitive() const noexcept { return Kind() <= ValueKind::String; }

    [[nodiscard]] bool IsNull() const noexcept { return Kind() == ValueKind::Null; }
    [[nodiscard]] bool IsBool() const noexcept { return Kind() == ValueKind::Bool; }
    [[nodiscard]] bool IsInt() const noexcept { return Kind() == ValueKind::Int; }
    [[nodiscard]] bool IsFloat() const noexcept { return Kind() == ValueKind::Float; }
    [[nodiscard]] bool IsString() const noexcept { return Kind() == ValueKind::String; }
    [[nodiscard]] bool IsList() const noexcept { return Kind() == ValueKind::List; }
    [[nodiscard]] bool IsTuple() const noexcept { return Kind() == ValueKind::Tuple; }
    [[nodiscard]] bool IsDict() const noexcept { return Kind() == ValueKind::Dict; }
    [[nodiscard]] bool IsObject() const noexcept { return Kind() == ValueKind::Object; }
    [[nodiscard]] bool IsClass() const noexcept { return Kind() == ValueKind::Class; }
    [[nodiscard]] bool IsFunction() const noexcept { return Kind() == ValueKind::Function; }
    [[nodiscard]] bool IsCallable() const noexcept { return Kind() == ValueKind::Callable; }

    // Unchecked accessors: the kind must match.
    [[nodiscard]] bool AsBool() const { return std::get<bool>(m_data); }
    [[nodiscard]] std::int64_t AsInt() const { return std::get<std::int64_t>(m_data); }
    [[nodiscard]] double AsFloat() const { return std::get<double>(m_data); }
    [[nodiscard]] const std::string &AsString() const { return std::get<std::string>(m_data); }
    [[nodiscard]] const List &AsList() const { return std::get<List>(m_data); }
    [[nodiscard]] List &AsList() { return std::get<List>(m_data); }
    [[nodiscard]] const Tuple &AsTuple() const { return std::get<Tuple>(m_data); }
    [[nodiscard]] const Dict &AsDict() const { return std::get<Dict>(m_data); }
    [[nodiscard]] Dict &AsDict() { return std::get<Dict>(m_data); }
    [[nodiscard]] const Object &AsObject() const { return std::get<Object>(m_data); }
    [[nodiscard]] Type AsClass() const;
    [[nodiscard]] Function AsFunction() const;
    [[nodiscard]] const Callable &AsCallable() const { return std::get<Callable>(m_data); }

    [[nodiscard]] const Storage &Data() const noexcept { return m_data; }

    friend SERIALIZABLE_API bool operator==(const Value &a, const Value &b);

  private:
    explicit Value(Storage data);

    Storage m_data{};
  };

  struct DictEntry
  {
    Value key;
    Value value;
  };

  struct CallableState
  {
    CallableKind kind{CallableKind::Anonymous};
    std::string name{};
    std::function<ExpectedValue(std::span<const Value>)> invoke{};
  };

} // namespace Serializable
