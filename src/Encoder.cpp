#include <Serializable/Codec.hpp>
#include <Serializable/KeyCodec.hpp>
#include <Serializable/Registry.hpp>
#include <Serializable/Resolver.hpp>

#include <string>
#include <variant>

namespace Serializable
{

  namespace
  {
    Ir ReferenceIr(const TypeReference &ref)
    {
      Ir out = Ir::object();
      out[std::string{ModuleKey}] = ref.module;
      out[std::string{NameKey}] = ref.name;
      return out;
    }

    ExpectedIr EncodeSequence(std::span<const Value> items)
    {
      Ir out = Ir::array();
      for (NGIN::UIntSize i = 0; i < items.size(); ++i)
      {
        auto e = Encode(items[i]);
        if (!e)
          return std::unexpected(std::move(e.error()));
        out.push_back(std::move(*e));
      }
      return out;
    }

    struct EncodeVisitor
    {
      ExpectedIr operator()(std::monostate) const { return Ir(nullptr); }
      ExpectedIr operator()(bool b) const { return Ir(b); }
      ExpectedIr operator()(std::int64_t i) const { return Ir(i); }
      ExpectedIr operator()(double d) const { return Ir(d); }
      ExpectedIr operator()(const std::string &s) const { return Ir(s); }

      ExpectedIr operator()(const List &l) const { return EncodeSequence(l.Items()); }

      ExpectedIr operator()(const Tuple &t) const
      {
        auto items = EncodeSequence(t.Items());
        if (!items)
          return items;
        detail::EnsureBuiltinsRegistered();
        Ir out = Ir::object();
        out[std::string{ClassKey}] = ReferenceIr(BuildReference(GetType<Tuple>()));
        out[std::string{ValueKey}] = std::move(*items);
        return out;
      }

      ExpectedIr operator()(const Dict &d) const { return EncodeDict(d); }

      ExpectedIr operator()(const Object &o) const
      {
        const Type type = o.GetType();
        if (!type.IsValid())
          return std::unexpected(Error{ErrorCode::UnencodableValue, "object of an unregistered type"});
        auto mapping = type.FieldMapping(o.Data());
        if (!mapping)
          return std::unexpected(std::move(mapping.error()));
        auto out = EncodeDict(*mapping);
        if (!out)
          return out;
        (*out)[std::string{ClassKey}] = ReferenceIr(BuildReference(type));
        return out;
      }

      ExpectedIr operator()(TypeHandle h) const { return ReferenceIr(BuildReference(Type{h})); }
      ExpectedIr operator()(FunctionHandle h) const { return ReferenceIr(BuildReference(Function{h})); }

      ExpectedIr operator()(const Callable &c) const
      {
        std::string name = c.Name().empty() ? std::string{"<anonymous>"} : std::string{c.Name()};
        switch (c.Kind())
        {
        case CallableKind::Closure:
          return std::unexpected(Error{ErrorCode::UnserializableClosure,
                                       "closure '" + name + "' captures enclosing state and cannot be serialized"});
        case CallableKind::BoundMethod:
          return std::unexpected(Error{ErrorCode::UnserializableCallable,
                                       "bound method '" + name + "' cannot be serialized"});
        case CallableKind::Anonymous:
          break;
        }
        return std::unexpected(Error{ErrorCode::UnserializableCallable,
                                     "callable '" + name + "' is not a registered module-level function"});
      }
    };
  } // namespace

  bool IsPrimitive(const Ir &ir) noexcept
  {
    return ir.is_null() || ir.is_boolean() || ir.is_number() || ir.is_string();
  }

  ExpectedIr Encode(const Value &value)
  {
    return std::visit(EncodeVisitor{}, value.Data());
  }

} // namespace Serializable
