#include <Serializable/Value.hpp>
#include <Serializable/Registry.hpp>

#include <NGIN/Hashing/FNV.hpp>

#include <cstring>
#include <string>

namespace Serializable
{

  std::string_view ErrorCodeName(ErrorCode code) noexcept
  {
    switch (code)
    {
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::Resolution:
      return "Resolution";
    case ErrorCode::UnserializableClosure:
      return "UnserializableClosure";
    case ErrorCode::UnserializableCallable:
      return "UnserializableCallable";
    case ErrorCode::UnencodableValue:
      return "UnencodableValue";
    case ErrorCode::MalformedRepresentation:
      return "MalformedRepresentation";
    case ErrorCode::Reconstruction:
      return "Reconstruction";
    }
    return "Unknown";
  }

  std::string_view ValueKindName(ValueKind kind) noexcept
  {
    switch (kind)
    {
    case ValueKind::Null:
      return "null";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Int:
      return "int";
    case ValueKind::Float:
      return "float";
    case ValueKind::String:
      return "string";
    case ValueKind::List:
      return "list";
    case ValueKind::Tuple:
      return "tuple";
    case ValueKind::Dict:
      return "dict";
    case ValueKind::Object:
      return "object";
    case ValueKind::Class:
      return "class";
    case ValueKind::Function:
      return "function";
    case ValueKind::Callable:
      return "callable";
    }
    return "unknown";
  }

  // List
  List::List(std::initializer_list<Value> items) : m_items(items) {}
  List::List(std::vector<Value> items) : m_items(std::move(items)) {}

  NGIN::UIntSize List::Size() const noexcept { return m_items.size(); }
  bool List::Empty() const noexcept { return m_items.empty(); }
  const Value &List::operator[](NGIN::UIntSize i) const { return m_items[i]; }
  Value &List::operator[](NGIN::UIntSize i) { return m_items[i]; }
  void List::PushBack(Value v) { m_items.push_back(std::move(v)); }
  std::span<const Value> List::Items() const noexcept { return m_items; }
  std::vector<Value>::const_iterator List::begin() const noexcept { return m_items.begin(); }
  std::vector<Value>::const_iterator List::end() const noexcept { return m_items.end(); }

  bool operator==(const List &a, const List &b)
  {
    return a.m_items == b.m_items;
  }

  // Tuple
  Tuple::Tuple(std::initializer_list<Value> items) : m_items(items) {}
  Tuple::Tuple(std::vector<Value> items) : m_items(std::move(items)) {}

  NGIN::UIntSize Tuple::Size() const noexcept { return m_items.size(); }
  const Value &Tuple::operator[](NGIN::UIntSize i) const { return m_items[i]; }
  std::span<const Value> Tuple::Items() const noexcept { return m_items; }
  std::vector<Value>::const_iterator Tuple::begin() const noexcept { return m_items.begin(); }
  std::vector<Value>::const_iterator Tuple::end() const noexcept { return m_items.end(); }

  bool operator==(const Tuple &a, const Tuple &b)
  {
    return a.m_items == b.m_items;
  }

  namespace
  {
    NGIN::UInt64 HashBytes(const void *data, NGIN::UIntSize size) noexcept
    {
      return NGIN::Hashing::FNV1a64(static_cast<const char *>(data), size);
    }

    NGIN::UInt64 Mix(NGIN::UInt64 seed, NGIN::UInt64 h) noexcept
    {
      return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
    }

    template <class Seq>
    NGIN::UInt64 HashSequence(NGIN::UInt64 seed, const Seq &items) noexcept
    {
      for (const auto &item : items)
        seed = Mix(seed, HashValue(item));
      return seed;
    }
  } // namespace

  NGIN::UInt64 HashValue(const Value &value) noexcept
  {
    const auto kind = value.Kind();
    NGIN::UInt64 seed = static_cast<NGIN::UInt64>(kind) + 1;
    switch (kind)
    {
    case ValueKind::Null:
      return seed;
    case ValueKind::Bool:
      return Mix(seed, value.AsBool() ? 1 : 0);
    case ValueKind::Int:
    {
      const NGIN::Int64 v = value.AsInt();
      return Mix(seed, HashBytes(&v, sizeof v));
    }
    case ValueKind::Float:
    {
      // 0.0 == -0.0, so both must hash alike.
      double v = value.AsFloat();
      if (v == 0.0)
        v = 0.0;
      NGIN::UInt64 bits = 0;
      std::memcpy(&bits, &v, sizeof bits);
      return Mix(seed, HashBytes(&bits, sizeof bits));
    }
    case ValueKind::String:
    {
      const auto &s = value.AsString();
      return Mix(seed, HashBytes(s.data(), s.size()));
    }
    case ValueKind::List:
      return HashSequence(seed, value.AsList());
    case ValueKind::Tuple:
      return HashSequence(seed, value.AsTuple());
    case ValueKind::Dict:
    {
      // Order-insensitive, like Dict equality.
      NGIN::UInt64 sum = 0;
      for (const auto &entry : value.AsDict())
        sum += Mix(HashValue(entry.key), HashValue(entry.value));
      return Mix(seed, sum);
    }
    case ValueKind::Object:
      return Mix(seed, value.AsObject().Handle().index);
    case ValueKind::Class:
      return Mix(seed, std::get<TypeHandle>(value.Data()).index);
    case ValueKind::Function:
      return Mix(seed, std::get<FunctionHandle>(value.Data()).index);
    case ValueKind::Callable:
    {
      const auto &c = value.AsCallable();
      const auto name = c.Name();
      return Mix(Mix(seed, static_cast<NGIN::UInt64>(c.Kind())), HashBytes(name.data(), name.size()));
    }
    }
    return seed;
  }

  // Dict
  namespace
  {
    constexpr NGIN::UIntSize NoIndex = static_cast<NGIN::UIntSize>(-1);
  }

  Dict::Dict(std::initializer_list<std::pair<Value, Value>> entries)
  {
    m_entries.reserve(entries.size());
    for (const auto &e : entries)
      Insert(e.first, e.second);
  }

  Dict::Dict(const Dict &other) : m_entries(other.m_entries)
  {
    Reindex();
  }

  Dict &Dict::operator=(const Dict &other)
  {
    if (this != &other)
    {
      m_entries = other.m_entries;
      Reindex();
    }
    return *this;
  }

  NGIN::UIntSize Dict::Size() const noexcept { return m_entries.size(); }
  bool Dict::Empty() const noexcept { return m_entries.empty(); }

  void Dict::Reindex()
  {
    m_index = {};
    for (NGIN::UIntSize i = 0; i < m_entries.size(); ++i)
    {
      const auto h = HashValue(m_entries[i].key);
      if (auto *bucket = m_index.GetPtr(h))
      {
        bucket->PushBack(i);
      }
      else
      {
        NGIN::Containers::Vector<NGIN::UIntSize> positions;
        positions.PushBack(i);
        m_index.Insert(h, std::move(positions));
      }
    }
  }

  NGIN::UIntSize Dict::IndexOf(const Value &key) const
  {
    const auto *bucket = m_index.GetPtr(HashValue(key));
    if (!bucket)
      return NoIndex;
    for (NGIN::UIntSize i = 0; i < bucket->Size(); ++i)
    {
      const auto pos = (*bucket)[i];
      if (m_entries[pos].key == key)
        return pos;
    }
    return NoIndex;
  }

  void Dict::Insert(Value key, Value value)
  {
    const auto h = HashValue(key);
    auto *bucket = m_index.GetPtr(h);
    if (bucket)
    {
      for (NGIN::UIntSize i = 0; i < bucket->Size(); ++i)
      {
        auto &entry = m_entries[(*bucket)[i]];
        if (entry.key == key)
        {
          entry.value = std::move(value);
          return;
        }
      }
    }
    const auto pos = m_entries.size();
    m_entries.push_back(DictEntry{std::move(key), std::move(value)});
    if (bucket)
    {
      bucket->PushBack(pos);
      return;
    }
    NGIN::Containers::Vector<NGIN::UIntSize> positions;
    positions.PushBack(pos);
    m_index.Insert(h, std::move(positions));
  }

  const Value *Dict::Find(const Value &key) const
  {
    const auto i = IndexOf(key);
    return i == NoIndex ? nullptr : &m_entries[i].value;
  }

  // Positions after the removed entry shift, so the index is rebuilt.
  std::optional<Value> Dict::Pop(std::string_view key)
  {
    const auto i = IndexOf(Value{key});
    if (i == NoIndex)
      return std::nullopt;
    Value out = std::move(m_entries[i].value);
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(i));
    Reindex();
    return out;
  }

  const DictEntry &Dict::EntryAt(NGIN::UIntSize i) const { return m_entries[i]; }
  std::vector<DictEntry>::const_iterator Dict::begin() const noexcept { return m_entries.begin(); }
  std::vector<DictEntry>::const_iterator Dict::end() const noexcept { return m_entries.end(); }

  bool operator==(const Dict &a, const Dict &b)
  {
    if (a.Size() != b.Size())
      return false;
    for (const auto &entry : a.m_entries)
    {
      const Value *other = b.Find(entry.key);
      if (!other || !(*other == entry.value))
        return false;
    }
    return true;
  }

  // Object
  Type Object::GetType() const
  {
    return Type{m_type};
  }

  bool operator==(const Object &a, const Object &b)
  {
    if (a.m_type.index != b.m_type.index)
      return false;
    return Type{a.m_type}.Equals(a.Data(), b.Data());
  }

  // Callable
  CallableKind Callable::Kind() const noexcept
  {
    return m_state ? m_state->kind : CallableKind::Anonymous;
  }

  std::string_view Callable::Name() const noexcept
  {
    return m_state ? std::string_view{m_state->name} : std::string_view{};
  }

  ExpectedValue Callable::Invoke(std::span<const Value> args) const
  {
    if (!m_state || !m_state->invoke)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "empty callable"});
    return m_state->invoke(args);
  }

  // Value
  Value::Value(List l) : m_data(std::move(l)) {}
  Value::Value(Tuple t) : m_data(std::move(t)) {}
  Value::Value(Dict d) : m_data(std::move(d)) {}
  Value::Value(Object o) : m_data(std::move(o)) {}
  Value::Value(Callable c) : m_data(std::move(c)) {}
  Value::Value(Storage data) : m_data(std::move(data)) {}

  Value Value::FromType(const Type &type)
  {
    return Value{Storage{std::in_place_type<TypeHandle>, type.Handle()}};
  }

  Value Value::FromFunction(const Function &fn)
  {
    return Value{Storage{std::in_place_type<FunctionHandle>, fn.Handle()}};
  }

  Type Value::AsClass() const
  {
    return Type{std::get<TypeHandle>(m_data)};
  }

  Function Value::AsFunction() const
  {
    return Function{std::get<FunctionHandle>(m_data)};
  }

  bool operator==(const Value &a, const Value &b)
  {
    if (a.Kind() != b.Kind())
      return false;
    switch (a.Kind())
    {
    case ValueKind::Null:
      return true;
    case ValueKind::Bool:
      return a.AsBool() == b.AsBool();
    case ValueKind::Int:
      return a.AsInt() == b.AsInt();
    case ValueKind::Float:
      return a.AsFloat() == b.AsFloat();
    case ValueKind::String:
      return a.AsString() == b.AsString();
    case ValueKind::List:
      return a.AsList() == b.AsList();
    case ValueKind::Tuple:
      return a.AsTuple() == b.AsTuple();
    case ValueKind::Dict:
      return a.AsDict() == b.AsDict();
    case ValueKind::Object:
      return a.AsObject() == b.AsObject();
    case ValueKind::Class:
      return std::get<TypeHandle>(a.m_data).index == std::get<TypeHandle>(b.m_data).index;
    case ValueKind::Function:
      return std::get<FunctionHandle>(a.m_data).index == std::get<FunctionHandle>(b.m_data).index;
    case ValueKind::Callable:
      return a.AsCallable() == b.AsCallable();
    }
    return false;
  }

} // namespace Serializable
