#include <Serializable/Codec.hpp>
#include <Serializable/KeyCodec.hpp>
#include <Serializable/Registry.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace Serializable
{

  namespace
  {
    Error ReconstructionError(std::string_view target, const Error &inner)
    {
      std::string msg{"cannot reconstruct "};
      msg.append(target);
      msg.append(": ");
      msg.append(inner.message);
      return Error{ErrorCode::Reconstruction, std::move(msg)};
    }

    ExpectedValue ReconstructFromClass(const Type &type, const std::optional<Value> &value, const Dict &fields)
    {
      if (value)
        return type.Construct(std::span<const Value>(&*value, 1));
      if (type.HasFromFields())
        return type.FromFieldMapping(fields);
      return type.ConstructNamed(fields);
    }

    ExpectedValue ReconstructFromFunction(const Function &fn, const std::optional<Value> &value, const Dict &fields)
    {
      if (value)
        return fn.Invoke(std::span<const Value>(&*value, 1));
      return fn.InvokeNamed(fields);
    }

    // Invokes whatever "__class__" referenced with "__value__" or the remaining fields.
    ExpectedValue Reconstruct(const Value &target, Dict fields)
    {
      const auto value = fields.Pop(ValueKey);
      if (target.IsClass())
      {
        const Type type = target.AsClass();
        auto made = ReconstructFromClass(type, value, fields);
        if (!made)
          return std::unexpected(ReconstructionError(type.QualifiedName(), made.error()));
        return made;
      }
      if (target.IsFunction())
      {
        const Function fn = target.AsFunction();
        auto made = ReconstructFromFunction(fn, value, fields);
        if (!made)
          return std::unexpected(ReconstructionError(fn.QualifiedName(), made.error()));
        return made;
      }
      return std::unexpected(Error{ErrorCode::Reconstruction, "\"__class__\" must reference a class or function, not a " +
                                                                  std::string{ValueKindName(target.Kind())}});
    }

    ExpectedValue DecodeObject(const Ir &ir)
    {
      if (ir.contains(std::string{NameKey}))
        return DecodeReference(ir);

      auto dict = DecodeDict(ir);
      if (!dict)
        return std::unexpected(std::move(dict.error()));
      auto target = dict->Pop(ClassKey);
      if (!target)
        return Value{std::move(*dict)};
      return Reconstruct(*target, std::move(*dict));
    }
  } // namespace

  ExpectedValue Decode(const Ir &ir)
  {
    using Kind = Ir::value_t;
    switch (ir.type())
    {
    case Kind::null:
      return Value{};
    case Kind::boolean:
      return Value{ir.get<bool>()};
    case Kind::number_integer:
      return Value{ir.get<std::int64_t>()};
    case Kind::number_unsigned:
    {
      const auto u = ir.get<std::uint64_t>();
      if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        return std::unexpected(Error{ErrorCode::MalformedRepresentation, "integer " + std::to_string(u) + " is out of range"});
      return Value{static_cast<std::int64_t>(u)};
    }
    case Kind::number_float:
      return Value{ir.get<double>()};
    case Kind::string:
      return Value{ir.get_ref<const std::string &>()};
    case Kind::array:
    {
      List out;
      for (const auto &element : ir)
      {
        auto v = Decode(element);
        if (!v)
          return v;
        out.PushBack(std::move(*v));
      }
      return Value{std::move(out)};
    }
    case Kind::object:
      return DecodeObject(ir);
    case Kind::binary:
    case Kind::discarded:
      break;
    }
    return std::unexpected(Error{ErrorCode::MalformedRepresentation, "unsupported IR node"});
  }

} // namespace Serializable
