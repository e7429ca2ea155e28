#include <Serializable/KeyCodec.hpp>
#include <Serializable/Json.hpp>
#include <Serializable/Resolver.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <variant>

namespace Serializable
{

  std::string PlaceholderKey(NGIN::UIntSize index)
  {
    std::string key{PlaceholderPrefix};
    key += std::to_string(index);
    return key;
  }

  std::optional<std::int64_t> ParsePlaceholderIndex(std::string_view key) noexcept
  {
    if (key.size() <= PlaceholderPrefix.size() || key.substr(0, PlaceholderPrefix.size()) != PlaceholderPrefix)
      return std::nullopt;
    const auto digits = key.substr(PlaceholderPrefix.size());
    std::int64_t index{0};
    const auto *first = digits.data();
    const auto *last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ptr != last)
      return std::nullopt;
    // Digits beyond int64 still name a placeholder; saturate so lookup rejects it.
    if (ec == std::errc::result_out_of_range)
      return digits.front() == '-' ? std::numeric_limits<std::int64_t>::min()
                                   : std::numeric_limits<std::int64_t>::max();
    if (ec != std::errc{})
      return std::nullopt;
    return index;
  }

  namespace
  {
    // NaN and infinities print as null and would collide with a null key.
    bool HasNonFiniteFloat(const Value &v)
    {
      switch (v.Kind())
      {
      case ValueKind::Float:
        return !std::isfinite(v.AsFloat());
      case ValueKind::List:
        for (const auto &item : v.AsList())
          if (HasNonFiniteFloat(item))
            return true;
        return false;
      case ValueKind::Tuple:
        for (const auto &item : v.AsTuple())
          if (HasNonFiniteFloat(item))
            return true;
        return false;
      case ValueKind::Dict:
        for (const auto &entry : v.AsDict())
          if (HasNonFiniteFloat(entry.key) || HasNonFiniteFloat(entry.value))
            return true;
        return false;
      default:
        return false;
      }
    }
  } // namespace

  // KeyTableWriter
  std::expected<std::string, Error> KeyTableWriter::Add(const Value &key)
  {
    if (HasNonFiniteFloat(key))
      return std::unexpected(Error{ErrorCode::UnencodableValue, "non-finite float cannot be used as a mapping key"});
    auto text = ToJson(key);
    if (!text)
      return std::unexpected(std::move(text.error()));
    if (auto it = m_index.find(*text); it != m_index.end())
      return PlaceholderKey(it->second);
    const auto index = m_entries.size();
    m_index.emplace(*text, index);
    m_entries.push_back(std::move(*text));
    return PlaceholderKey(index);
  }

  Ir KeyTableWriter::ToIr() const
  {
    Ir out = Ir::array();
    for (const auto &entry : m_entries)
      out.push_back(entry);
    return out;
  }

  // KeyTableReader
  std::expected<KeyTableReader, Error> KeyTableReader::FromIr(const Ir *table)
  {
    KeyTableReader reader;
    if (!table)
      return reader;
    if (!table->is_array())
      return std::unexpected(Error{ErrorCode::MalformedRepresentation, "\"__serialized_keys__\" must be an array"});
    for (const auto &entry : *table)
    {
      if (!entry.is_string())
        return std::unexpected(Error{ErrorCode::MalformedRepresentation, "\"__serialized_keys__\" entries must be strings"});
      auto key = FromJson(entry.get_ref<const std::string &>());
      if (!key)
        return std::unexpected(std::move(key.error()));
      reader.m_keys.push_back(std::move(*key));
    }
    return reader;
  }

  ExpectedValue KeyTableReader::KeyFor(std::string_view key) const
  {
    const auto index = ParsePlaceholderIndex(key);
    if (!index)
      return Value{key};
    if (*index < 0 || static_cast<std::uint64_t>(*index) >= m_keys.size())
      return std::unexpected(Error{ErrorCode::Reconstruction,
                                   "placeholder '" + std::string{key} + "' has no entry in \"__serialized_keys__\""});
    return m_keys[static_cast<NGIN::UIntSize>(*index)];
  }

  ExpectedIr EncodeDict(const Dict &dict)
  {
    Ir out = Ir::object();
    KeyTableWriter keys;
    for (const auto &entry : dict)
    {
      std::string name;
      if (entry.key.IsString())
      {
        name = entry.key.AsString();
      }
      else
      {
        auto placeholder = keys.Add(entry.key);
        if (!placeholder)
          return std::unexpected(std::move(placeholder.error()));
        name = std::move(*placeholder);
      }
      auto value = Encode(entry.value);
      if (!value)
        return value;
      out[name] = std::move(*value);
    }
    if (!keys.Empty())
      out[std::string{SerializedKeysKey}] = keys.ToIr();
    return out;
  }

  std::expected<Dict, Error> DecodeDict(const Ir &object)
  {
    const Ir *table = nullptr;
    if (auto it = object.find(std::string{SerializedKeysKey}); it != object.end())
      table = &*it;
    auto keys = KeyTableReader::FromIr(table);
    if (!keys)
      return std::unexpected(std::move(keys.error()));

    Dict out;
    for (auto it = object.begin(); it != object.end(); ++it)
    {
      if (it.key() == SerializedKeysKey)
        continue;
      auto key = keys->KeyFor(it.key());
      if (!key)
        return std::unexpected(std::move(key.error()));
      auto value = Decode(it.value());
      if (!value)
        return std::unexpected(std::move(value.error()));
      out.Insert(std::move(*key), std::move(*value));
    }
    return out;
  }

  ExpectedValue DecodeReference(const Ir &object)
  {
    const auto module = object.find(std::string{ModuleKey});
    const auto name = object.find(std::string{NameKey});
    if (module == object.end() || name == object.end() || !module->is_string() || !name->is_string())
      return std::unexpected(Error{ErrorCode::MalformedRepresentation,
                                   "a reference needs string \"__module__\" and \"__name__\" members"});
    auto resolved = Resolve(module->get_ref<const std::string &>(), name->get_ref<const std::string &>());
    if (!resolved)
      return std::unexpected(std::move(resolved.error()));
    if (const auto *type = std::get_if<Type>(&*resolved))
      return Value::FromType(*type);
    return Value::FromFunction(std::get<Function>(*resolved));
  }

} // namespace Serializable
