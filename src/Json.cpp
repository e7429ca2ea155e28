#include <Serializable/Json.hpp>

namespace Serializable
{

  std::string JsonPrint(const Ir &ir)
  {
    return ir.dump(-1, ' ', false, Ir::error_handler_t::replace);
  }

  ExpectedIr JsonParse(std::string_view text)
  {
    auto ir = Ir::parse(text.begin(), text.end(), nullptr, false);
    if (ir.is_discarded())
      return std::unexpected(Error{ErrorCode::MalformedRepresentation, "invalid JSON text"});
    return ir;
  }

  std::expected<std::string, Error> ToJson(const Value &value)
  {
    auto ir = Encode(value);
    if (!ir)
      return std::unexpected(std::move(ir.error()));
    return JsonPrint(*ir);
  }

  ExpectedValue FromJson(std::string_view text)
  {
    auto ir = JsonParse(text);
    if (!ir)
      return std::unexpected(std::move(ir.error()));
    return Decode(*ir);
  }

} // namespace Serializable
