// KeyCodec.hpp
// Reserved keys and the placeholder scheme for non-string dictionary keys
#pragma once

#include <NGIN/Primitives.hpp>

#include <Serializable/Codec.hpp>
#include <Serializable/Export.hpp>
#include <Serializable/Types.hpp>
#include <Serializable/Value.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Serializable
{

  inline constexpr std::string_view ClassKey = "__class__";
  inline constexpr std::string_view ValueKey = "__value__";
  inline constexpr std::string_view ModuleKey = "__module__";
  inline constexpr std::string_view NameKey = "__name__";
  inline constexpr std::string_view SerializedKeysKey = "__serialized_keys__";
  inline constexpr std::string_view PlaceholderPrefix = "__serialized_keys__element_";

  // "__serialized_keys__element_<index>"
  [[nodiscard]] SERIALIZABLE_API std::string PlaceholderKey(NGIN::UIntSize index);

  // Index of a placeholder key; nullopt for ordinary keys (including a prefix followed by non-digits).
  // Out-of-range digit runs saturate to the int64 limits.
  [[nodiscard]] SERIALIZABLE_API std::optional<std::int64_t> ParsePlaceholderIndex(std::string_view key) noexcept;

  // Collects the JSON text of non-string keys, one entry per distinct text.
  class SERIALIZABLE_API KeyTableWriter
  {
  public:
    // Placeholder naming the key; equal key texts share one placeholder.
    [[nodiscard]] std::expected<std::string, Error> Add(const Value &key);
    [[nodiscard]] bool Empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] Ir ToIr() const;

  private:
    std::vector<std::string> m_entries;
    std::unordered_map<std::string, NGIN::UIntSize> m_index;
  };

  // Decoded "__serialized_keys__" table.
  class SERIALIZABLE_API KeyTableReader
  {
  public:
    KeyTableReader() = default;

    // table may be null (no key table present).
    [[nodiscard]] static std::expected<KeyTableReader, Error> FromIr(const Ir *table);

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_keys.size(); }
    // The real key behind an IR object key: a table entry for placeholders, the string itself otherwise.
    [[nodiscard]] ExpectedValue KeyFor(std::string_view key) const;

  private:
    std::vector<Value> m_keys;
  };

  // Dict -> IR object; string keys are kept, all others are replaced by placeholders.
  [[nodiscard]] SERIALIZABLE_API ExpectedIr EncodeDict(const Dict &dict);

  // IR object (without "__name__") -> Dict with placeholder keys substituted.
  [[nodiscard]] SERIALIZABLE_API std::expected<Dict, Error> DecodeDict(const Ir &object);

  // Bare {"__module__", "__name__"} -> Class or Function value.
  [[nodiscard]] SERIALIZABLE_API ExpectedValue DecodeReference(const Ir &object);

} // namespace Serializable
