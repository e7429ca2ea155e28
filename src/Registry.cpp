#include <Serializable/Registry.hpp>
#include <Serializable/NameUtils.hpp>

#include <string>
#include <vector>

namespace Serializable::detail
{

  Registry &GetRegistry() noexcept
  {
    static Registry registry{};
    return registry;
  }

  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);

    bool StartsWithScope(std::string_view path, std::string_view prefix)
    {
      return path.size() > prefix.size() && path.substr(0, prefix.size()) == prefix && path[prefix.size()] == '.';
    }
  } // namespace

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  NGIN::UInt32 AddType(TypeRuntimeDesc &&rec, std::string_view moduleName, std::string_view name)
  {
    auto &reg = GetRegistry();
    const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
    const auto tid = rec.typeId;
    reg.types.PushBack(std::move(rec));
    reg.byTypeId.Insert(tid, idx);
    RenameType(idx, moduleName, name);
    return idx;
  }

  void RenameType(NGIN::UInt32 index, std::string_view moduleName, std::string_view name)
  {
    auto &reg = GetRegistry();
    // Intern before taking a reference: interning never touches the type table.
    const auto moduleId = InternNameId(moduleName);
    const auto nameId = InternNameId(name);
    const auto qualifiedId = InternNameId(JoinPath(moduleName, name));

    auto &rec = reg.types[index];
    if (rec.qualifiedNameId != static_cast<NameId>(-1))
    {
      if (auto *p = reg.byName.GetPtr(rec.qualifiedNameId); p && *p == index)
        reg.byName.Remove(rec.qualifiedNameId);
    }
    rec.moduleName = NameFromId(moduleId);
    rec.name = NameFromId(nameId);
    rec.qualifiedNameId = qualifiedId;
    rec.qualifiedName = NameFromId(qualifiedId);
    // First registration of a path wins, whether it named a type or a function.
    if (!reg.byName.GetPtr(qualifiedId) && !reg.functionByName.GetPtr(qualifiedId))
      reg.byName.Insert(qualifiedId, index);
  }

  std::expected<NGIN::UInt32, Error> AddFunction(FunctionRuntimeDesc &&rec, std::string_view moduleName, std::string_view name,
                                                 std::initializer_list<std::string_view> paramNames)
  {
    auto &reg = GetRegistry();
    if (moduleName.empty() || name.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "function module and name must be non-empty"});
    const auto path = JoinPath(moduleName, name);
    const auto qualifiedId = InternNameId(path);
    if (reg.functionByName.GetPtr(qualifiedId) || reg.byName.GetPtr(qualifiedId))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "duplicate registration of '" + path + "'"});

    rec.moduleName = NameFromId(InternNameId(moduleName));
    rec.name = NameFromId(InternNameId(name));
    rec.qualifiedNameId = qualifiedId;
    rec.qualifiedName = NameFromId(qualifiedId);
    for (auto n : paramNames)
      rec.paramNames.PushBack(NameFromId(InternNameId(n)));

    const auto idx = static_cast<NGIN::UInt32>(reg.functions.Size());
    const auto address = rec.address;
    reg.functions.PushBack(std::move(rec));
    reg.functionByName.Insert(qualifiedId, idx);
    if (!reg.functionByAddress.GetPtr(address))
      reg.functionByAddress.Insert(address, idx);
    return idx;
  }

  std::optional<NGIN::UInt32> FindFunctionByAddress(NGIN::UInt64 address) noexcept
  {
    auto &reg = GetRegistry();
    if (auto *p = reg.functionByAddress.GetPtr(address))
      return *p;
    return std::nullopt;
  }

  void NestUnderEnclosingType(std::string &module, std::string &name)
  {
    auto &reg = GetRegistry();
    NameId id{};
    if (!FindNameId(module, id))
      return;
    const auto *p = reg.byName.GetPtr(id);
    if (!p)
      return;
    const auto &outer = reg.types[*p];
    name = JoinPath(outer.name, name);
    module = std::string{outer.moduleName};
  }

  bool IsKnownScope(std::string_view prefix)
  {
    const auto &reg = GetRegistry();
    for (NGIN::UIntSize i = 0; i < reg.types.Size(); ++i)
    {
      const auto qn = reg.types[i].qualifiedName;
      if (qn == prefix || StartsWithScope(qn, prefix))
        return true;
    }
    for (NGIN::UIntSize i = 0; i < reg.functions.Size(); ++i)
    {
      if (StartsWithScope(reg.functions[i].qualifiedName, prefix))
        return true;
    }
    return false;
  }

} // namespace Serializable::detail

namespace Serializable
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsTypeAlive(NGIN::UInt32 index)
    {
      return index != static_cast<NGIN::UInt32>(-1) && index < GetRegistry().types.Size();
    }

    bool IsFieldAlive(FieldHandle h)
    {
      if (!h.IsValid() || !IsTypeAlive(h.typeIndex))
        return false;
      return h.fieldIndex < GetRegistry().types[h.typeIndex].fields.Size();
    }

    bool IsCtorAlive(ConstructorHandle h)
    {
      if (!h.IsValid() || !IsTypeAlive(h.typeIndex))
        return false;
      return h.ctorIndex < GetRegistry().types[h.typeIndex].constructors.Size();
    }

    bool IsFunctionAlive(FunctionHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().functions.Size();
    }

    Error WithContext(ErrorCode code, std::string_view qualifiedName, const Error &inner)
    {
      std::string msg{qualifiedName};
      msg += ": ";
      msg += inner.message;
      return Error{code, std::move(msg)};
    }
  } // namespace

  // Field
  bool Field::IsValid() const noexcept
  {
    return IsFieldAlive(m_h);
  }

  std::string_view Field::Name() const
  {
    if (!IsFieldAlive(m_h))
      return {};
    return GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].name;
  }

  Value Field::Load(const void *obj) const
  {
    if (!IsFieldAlive(m_h))
      return Value{};
    return GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].Load(obj);
  }

  std::expected<void, Error> Field::Store(void *obj, const Value &value) const
  {
    if (!IsFieldAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    return GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].Store(obj, value);
  }

  // Constructor
  bool Constructor::IsValid() const noexcept
  {
    return IsCtorAlive(m_h);
  }

  NGIN::UIntSize Constructor::ParameterCount() const
  {
    if (!IsCtorAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.typeIndex].constructors[m_h.ctorIndex].paramTypeIds.Size();
  }

  std::string_view Constructor::ParameterName(NGIN::UIntSize i) const
  {
    if (!IsCtorAlive(m_h))
      return {};
    const auto &names = GetRegistry().types[m_h.typeIndex].constructors[m_h.ctorIndex].paramNames;
    return i < names.Size() ? names[i] : std::string_view{};
  }

  ExpectedValue Constructor::Construct(std::span<const Value> args) const
  {
    if (!IsCtorAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &c = GetRegistry().types[m_h.typeIndex].constructors[m_h.ctorIndex];
    auto made = c.Construct(args.data(), args.size());
    if (!made)
      return std::unexpected(made.error());
    return Type{TypeHandle{m_h.typeIndex}}.Box(*made);
  }

  // Type
  bool Type::IsValid() const noexcept
  {
    return IsTypeAlive(m_h.index);
  }

  std::string_view Type::ModuleName() const
  {
    if (!IsTypeAlive(m_h.index))
      return {};
    return GetRegistry().types[m_h.index].moduleName;
  }

  std::string_view Type::Name() const
  {
    if (!IsTypeAlive(m_h.index))
      return {};
    return GetRegistry().types[m_h.index].name;
  }

  std::string_view Type::QualifiedName() const
  {
    if (!IsTypeAlive(m_h.index))
      return {};
    return GetRegistry().types[m_h.index].qualifiedName;
  }

  NGIN::UIntSize Type::FieldCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].fields.Size();
  }

  Field Type::FieldAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return Field{};
    return Field{FieldHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedField Type::GetField(std::string_view name) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    if (auto f = FindField(name))
      return *f;
    return std::unexpected(Error{ErrorCode::NotFound, "field '" + std::string{name} + "' not found"});
  }

  std::optional<Field> Type::FindField(std::string_view name) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = tdesc.fieldIndex.GetPtr(nid))
        return Field{FieldHandle{m_h.index, *p}};
    }
    return std::nullopt;
  }

  NGIN::UIntSize Type::ConstructorCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].constructors.Size();
  }

  Constructor Type::ConstructorAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return Constructor{};
    return Constructor{ConstructorHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  bool Type::HasToFields() const
  {
    return IsTypeAlive(m_h.index) && GetRegistry().types[m_h.index].ToFields != nullptr;
  }

  bool Type::HasFromFields() const
  {
    return IsTypeAlive(m_h.index) && GetRegistry().types[m_h.index].FromFields != nullptr;
  }

  ExpectedValue Type::Construct(std::span<const Value> args) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &tdesc = GetRegistry().types[m_h.index];
    std::optional<Error> lastError;
    for (NGIN::UIntSize i = 0; i < tdesc.constructors.Size(); ++i)
    {
      const auto &c = tdesc.constructors[i];
      if (c.paramTypeIds.Size() != args.size())
        continue;
      auto made = c.Construct(args.data(), args.size());
      if (made)
        return Box(*made);
      lastError = made.error();
    }
    if (lastError)
      return std::unexpected(WithContext(lastError->code, tdesc.qualifiedName, *lastError));
    return std::unexpected(Error{ErrorCode::InvalidArgument, "no constructor of " + std::string{tdesc.qualifiedName} +
                                                                 " takes " + std::to_string(args.size()) + " argument(s)"});
  }

  ExpectedValue Type::ConstructNamed(const Dict &fields) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &tdesc = GetRegistry().types[m_h.index];
    for (const auto &entry : fields)
    {
      if (!entry.key.IsString())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "keyword arguments must have string keys"});
    }

    std::optional<Error> lastError;
    for (NGIN::UIntSize i = 0; i < tdesc.constructors.Size(); ++i)
    {
      const auto &c = tdesc.constructors[i];
      const auto arity = c.paramTypeIds.Size();
      if (arity != fields.Size() || c.paramNames.Size() != arity)
        continue;
      std::vector<Value> args;
      args.reserve(arity);
      for (NGIN::UIntSize p = 0; p < arity; ++p)
      {
        const Value *v = fields.Find(Value{c.paramNames[p]});
        if (!v)
          break;
        args.push_back(*v);
      }
      if (args.size() != arity)
        continue;
      auto made = c.Construct(args.data(), args.size());
      if (made)
        return Box(*made);
      lastError = made.error();
    }

    if (tdesc.AssignFields && tdesc.fields.Size() > 0)
    {
      auto made = tdesc.AssignFields(fields);
      if (!made)
        return std::unexpected(WithContext(made.error().code, tdesc.qualifiedName, made.error()));
      return Box(*made);
    }
    if (lastError)
      return std::unexpected(WithContext(lastError->code, tdesc.qualifiedName, *lastError));
    return std::unexpected(Error{ErrorCode::InvalidArgument,
                                 std::string{tdesc.qualifiedName} + " has no constructor accepting these keyword arguments"});
  }

  ExpectedValue Type::FromFieldMapping(const Dict &fields) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (!tdesc.FromFields)
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{tdesc.qualifiedName} + " has no from-mapping factory"});
    auto made = tdesc.FromFields(fields);
    if (!made)
      return std::unexpected(WithContext(made.error().code, tdesc.qualifiedName, made.error()));
    return Box(*made);
  }

  std::expected<Dict, Error> Type::FieldMapping(const void *obj) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (tdesc.ToFields)
      return tdesc.ToFields(obj);
    if (tdesc.fields.Size() == 0)
      return std::unexpected(Error{ErrorCode::UnencodableValue,
                                   std::string{tdesc.qualifiedName} + " exposes neither a to-mapping nor fields"});
    Dict out;
    for (NGIN::UIntSize i = 0; i < tdesc.fields.Size(); ++i)
      out.Insert(Value{tdesc.fields[i].name}, tdesc.fields[i].Load(obj));
    return out;
  }

  bool Type::Equals(const void *a, const void *b) const
  {
    if (!IsTypeAlive(m_h.index))
      return false;
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (tdesc.Equals)
      return tdesc.Equals(a, b);
    auto ma = FieldMapping(a);
    auto mb = FieldMapping(b);
    return ma && mb && *ma == *mb;
  }

  Value Type::Box(const Any &instance) const
  {
    if (IsTypeAlive(m_h.index))
    {
      const auto &tdesc = GetRegistry().types[m_h.index];
      if (tdesc.Box)
        return tdesc.Box(instance);
    }
    return Value{Object{m_h, instance}};
  }

  // Function
  bool Function::IsValid() const noexcept
  {
    return IsFunctionAlive(m_h);
  }

  std::string_view Function::ModuleName() const
  {
    if (!IsFunctionAlive(m_h))
      return {};
    return GetRegistry().functions[m_h.index].moduleName;
  }

  std::string_view Function::Name() const
  {
    if (!IsFunctionAlive(m_h))
      return {};
    return GetRegistry().functions[m_h.index].name;
  }

  std::string_view Function::QualifiedName() const
  {
    if (!IsFunctionAlive(m_h))
      return {};
    return GetRegistry().functions[m_h.index].qualifiedName;
  }

  NGIN::UIntSize Function::ParameterCount() const
  {
    if (!IsFunctionAlive(m_h))
      return 0;
    return GetRegistry().functions[m_h.index].paramTypeIds.Size();
  }

  std::string_view Function::ParameterName(NGIN::UIntSize i) const
  {
    if (!IsFunctionAlive(m_h))
      return {};
    const auto &names = GetRegistry().functions[m_h.index].paramNames;
    return i < names.Size() ? names[i] : std::string_view{};
  }

  ExpectedValue Function::Invoke(std::span<const Value> args) const
  {
    if (!IsFunctionAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &f = GetRegistry().functions[m_h.index];
    auto r = f.Invoke(args.data(), args.size());
    if (!r)
      return std::unexpected(WithContext(r.error().code, f.qualifiedName, r.error()));
    return r;
  }

  ExpectedValue Function::InvokeNamed(const Dict &args) const
  {
    if (!IsFunctionAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kStaleHandle}});
    const auto &f = GetRegistry().functions[m_h.index];
    const auto arity = f.paramTypeIds.Size();
    if (args.Size() != arity || (arity > 0 && f.paramNames.Size() != arity))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   std::string{f.qualifiedName} + " does not accept these keyword arguments"});
    std::vector<Value> ordered;
    ordered.reserve(arity);
    for (NGIN::UIntSize i = 0; i < arity; ++i)
    {
      const Value *v = args.Find(Value{f.paramNames[i]});
      if (!v)
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     std::string{f.qualifiedName} + ": missing argument '" + std::string{f.paramNames[i]} + "'"});
      ordered.push_back(*v);
    }
    return Invoke(ordered);
  }

  // Queries
  ExpectedType GetType(std::string_view path)
  {
    if (auto t = FindType(path))
      return *t;
    return std::unexpected(Error{ErrorCode::NotFound, "type '" + std::string{path} + "' not found"});
  }

  std::optional<Type> FindType(std::string_view path)
  {
    detail::EnsureBuiltinsRegistered();
    auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(path, nid))
    {
      if (auto *p = reg.byName.GetPtr(nid))
        return Type{TypeHandle{*p}};
    }
    return std::nullopt;
  }

  ExpectedFunction GetFunction(std::string_view path)
  {
    if (auto f = FindFunction(path))
      return *f;
    return std::unexpected(Error{ErrorCode::NotFound, "function '" + std::string{path} + "' not found"});
  }

  std::optional<Function> FindFunction(std::string_view path)
  {
    auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(path, nid))
    {
      if (auto *p = reg.functionByName.GetPtr(nid))
        return Function{FunctionHandle{*p}};
    }
    return std::nullopt;
  }

} // namespace Serializable
