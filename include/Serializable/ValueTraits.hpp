// ValueTraits.hpp
// Conversions between C++ types and Value (sequence/tuple/map/optional adapters)
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <Serializable/Registry.hpp>
#include <Serializable/Types.hpp>
#include <Serializable/Value.hpp>

#include <array>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Serializable
{

  namespace detail
  {
    template <class T>
    inline Error ConversionError(const Value &v)
    {
      std::string msg{"cannot convert "};
      msg += ValueKindName(v.Kind());
      msg += " to ";
      msg += NGIN::Meta::TypeName<T>::qualifiedName;
      return Error{ErrorCode::InvalidArgument, std::move(msg)};
    }

    // Elements of a List or a Tuple.
    inline std::optional<std::span<const Value>> SequenceItems(const Value &v)
    {
      if (v.IsList())
        return v.AsList().Items();
      if (v.IsTuple())
        return v.AsTuple().Items();
      return std::nullopt;
    }
  } // namespace detail

  // Generic class types travel as Objects of their registered type.
  template <class T>
  struct ValueTraits
  {
    static Value ToValue(const T &v)
    {
      return Value{Object{GetType<T>().Handle(), Any{v}}};
    }

    static std::expected<T, Error> FromValue(const Value &v)
    {
      if (v.IsObject())
      {
        if (const T *p = v.AsObject().template TryAs<T>())
          return *p;
      }
      return std::unexpected(detail::ConversionError<T>(v));
    }
  };

  template <>
  struct ValueTraits<Value>
  {
    static Value ToValue(const Value &v) { return v; }
    static std::expected<Value, Error> FromValue(const Value &v) { return v; }
  };

  template <>
  struct ValueTraits<bool>
  {
    static Value ToValue(bool v) { return Value{v}; }
    static std::expected<bool, Error> FromValue(const Value &v)
    {
      if (v.IsBool())
        return v.AsBool();
      return std::unexpected(detail::ConversionError<bool>(v));
    }
  };

  template <class T>
  requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
  struct ValueTraits<T>
  {
    static Value ToValue(T v) { return Value{v}; }
    static std::expected<T, Error> FromValue(const Value &v)
    {
      if (v.IsBool())
        return static_cast<T>(v.AsBool() ? 1 : 0);
      if (v.IsInt())
      {
        if (!std::in_range<T>(v.AsInt()))
          return std::unexpected(Error{ErrorCode::InvalidArgument, "integer out of range"});
        return static_cast<T>(v.AsInt());
      }
      return std::unexpected(detail::ConversionError<T>(v));
    }
  };

  template <class T>
  requires std::is_floating_point_v<T>
  struct ValueTraits<T>
  {
    static Value ToValue(T v) { return Value{v}; }
    static std::expected<T, Error> FromValue(const Value &v)
    {
      if (v.IsFloat())
        return static_cast<T>(v.AsFloat());
      if (v.IsInt())
        return static_cast<T>(v.AsInt());
      return std::unexpected(detail::ConversionError<T>(v));
    }
  };

  template <>
  struct ValueTraits<std::string>
  {
    static Value ToValue(const std::string &v) { return Value{v}; }
    static std::expected<std::string, Error> FromValue(const Value &v)
    {
      if (v.IsString())
        return v.AsString();
      return std::unexpected(detail::ConversionError<std::string>(v));
    }
  };

  // Outbound only: a view cannot own decoded text.
  template <>
  struct ValueTraits<std::string_view>
  {
    static Value ToValue(std::string_view v) { return Value{v}; }
  };

  template <>
  struct ValueTraits<List>
  {
    static Value ToValue(const List &v) { return Value{v}; }
    static std::expected<List, Error> FromValue(const Value &v)
    {
      if (v.IsList())
        return v.AsList();
      if (v.IsTuple())
        return List{std::vector<Value>(v.AsTuple().begin(), v.AsTuple().end())};
      return std::unexpected(detail::ConversionError<List>(v));
    }
  };

  template <>
  struct ValueTraits<Tuple>
  {
    static Value ToValue(const Tuple &v) { return Value{v}; }
    static std::expected<Tuple, Error> FromValue(const Value &v)
    {
      if (v.IsTuple())
        return v.AsTuple();
      if (v.IsList())
        return Tuple{std::vector<Value>(v.AsList().begin(), v.AsList().end())};
      return std::unexpected(detail::ConversionError<Tuple>(v));
    }
  };

  template <>
  struct ValueTraits<Dict>
  {
    static Value ToValue(const Dict &v) { return Value{v}; }
    static std::expected<Dict, Error> FromValue(const Value &v)
    {
      if (v.IsDict())
        return v.AsDict();
      return std::unexpected(detail::ConversionError<Dict>(v));
    }
  };

  namespace detail
  {
    template <class Seq, class Elem>
    std::expected<Seq, Error> SequenceFromValue(const Value &v)
    {
      auto items = SequenceItems(v);
      if (!items)
        return std::unexpected(ConversionError<Seq>(v));
      Seq out{};
      for (NGIN::UIntSize i = 0; i < items->size(); ++i)
      {
        auto e = ValueTraits<Elem>::FromValue((*items)[i]);
        if (!e)
          return std::unexpected(e.error());
        if constexpr (requires(Seq &s) { s.PushBack(std::move(*e)); })
          out.PushBack(std::move(*e));
        else
          out.push_back(std::move(*e));
      }
      return out;
    }

    template <class Map, class K, class V>
    Value MapToValue(const Map &m)
    {
      Dict d;
      for (const auto &[k, v] : m)
        d.Insert(ValueTraits<K>::ToValue(k), ValueTraits<V>::ToValue(v));
      return Value{std::move(d)};
    }

    template <class Map, class K, class V>
    std::expected<Map, Error> MapFromValue(const Value &v)
    {
      if (!v.IsDict())
        return std::unexpected(ConversionError<Map>(v));
      Map out{};
      for (const auto &entry : v.AsDict())
      {
        auto key = ValueTraits<K>::FromValue(entry.key);
        if (!key)
          return std::unexpected(key.error());
        auto val = ValueTraits<V>::FromValue(entry.value);
        if (!val)
          return std::unexpected(val.error());
        out.insert_or_assign(std::move(*key), std::move(*val));
      }
      return out;
    }

    template <class Tup, std::size_t... I>
    Value TupleToValue(const Tup &t, std::index_sequence<I...>)
    {
      return Value{Tuple{ValueTraits<std::remove_cvref_t<std::tuple_element_t<I, Tup>>>::ToValue(std::get<I>(t))...}};
    }

    template <class Tup, std::size_t... I>
    std::expected<Tup, Error> TupleFromValue(const Value &v, std::index_sequence<I...>)
    {
      auto items = SequenceItems(v);
      if (!items || items->size() != sizeof...(I))
        return std::unexpected(ConversionError<Tup>(v));
      std::tuple<std::expected<std::remove_cvref_t<std::tuple_element_t<I, Tup>>, Error>...> parts{
          ValueTraits<std::remove_cvref_t<std::tuple_element_t<I, Tup>>>::FromValue((*items)[I])...};
      std::optional<Error> failure;
      ((std::get<I>(parts).has_value() || failure.has_value() || (failure = std::get<I>(parts).error(), true)), ...);
      if (failure)
        return std::unexpected(std::move(*failure));
      return Tup{std::move(*std::get<I>(parts))...};
    }
  } // namespace detail

  template <class T, class A>
  struct ValueTraits<std::vector<T, A>>
  {
    static Value ToValue(const std::vector<T, A> &v)
    {
      List out;
      for (const auto &e : v)
        out.PushBack(ValueTraits<T>::ToValue(e));
      return Value{std::move(out)};
    }
    static std::expected<std::vector<T, A>, Error> FromValue(const Value &v)
    {
      return detail::SequenceFromValue<std::vector<T, A>, T>(v);
    }
  };

  template <class T, class Alloc>
  struct ValueTraits<NGIN::Containers::Vector<T, Alloc>>
  {
    static Value ToValue(const NGIN::Containers::Vector<T, Alloc> &v)
    {
      List out;
      for (NGIN::UIntSize i = 0; i < v.Size(); ++i)
        out.PushBack(ValueTraits<T>::ToValue(v[i]));
      return Value{std::move(out)};
    }
    static std::expected<NGIN::Containers::Vector<T, Alloc>, Error> FromValue(const Value &v)
    {
      return detail::SequenceFromValue<NGIN::Containers::Vector<T, Alloc>, T>(v);
    }
  };

  template <class T, std::size_t N>
  struct ValueTraits<std::array<T, N>>
  {
    static Value ToValue(const std::array<T, N> &v)
    {
      return detail::TupleToValue(v, std::make_index_sequence<N>{});
    }
    static std::expected<std::array<T, N>, Error> FromValue(const Value &v)
    {
      auto items = detail::SequenceItems(v);
      if (!items || items->size() != N)
        return std::unexpected(detail::ConversionError<std::array<T, N>>(v));
      std::array<T, N> out{};
      for (std::size_t i = 0; i < N; ++i)
      {
        auto e = ValueTraits<T>::FromValue((*items)[i]);
        if (!e)
          return std::unexpected(e.error());
        out[i] = std::move(*e);
      }
      return out;
    }
  };

  template <class A, class B>
  struct ValueTraits<std::pair<A, B>>
  {
    static Value ToValue(const std::pair<A, B> &v)
    {
      return Value{Tuple{ValueTraits<A>::ToValue(v.first), ValueTraits<B>::ToValue(v.second)}};
    }
    static std::expected<std::pair<A, B>, Error> FromValue(const Value &v)
    {
      auto t = detail::TupleFromValue<std::tuple<A, B>>(v, std::index_sequence<0, 1>{});
      if (!t)
        return std::unexpected(t.error());
      return std::pair<A, B>{std::move(std::get<0>(*t)), std::move(std::get<1>(*t))};
    }
  };

  template <class... Ts>
  struct ValueTraits<std::tuple<Ts...>>
  {
    static Value ToValue(const std::tuple<Ts...> &v)
    {
      return detail::TupleToValue(v, std::index_sequence_for<Ts...>{});
    }
    static std::expected<std::tuple<Ts...>, Error> FromValue(const Value &v)
    {
      return detail::TupleFromValue<std::tuple<Ts...>>(v, std::index_sequence_for<Ts...>{});
    }
  };

  template <class K, class V, class C, class A>
  struct ValueTraits<std::map<K, V, C, A>>
  {
    static Value ToValue(const std::map<K, V, C, A> &v) { return detail::MapToValue<std::map<K, V, C, A>, K, V>(v); }
    static std::expected<std::map<K, V, C, A>, Error> FromValue(const Value &v)
    {
      return detail::MapFromValue<std::map<K, V, C, A>, K, V>(v);
    }
  };

  template <class K, class V, class H, class E, class A>
  struct ValueTraits<std::unordered_map<K, V, H, E, A>>
  {
    static Value ToValue(const std::unordered_map<K, V, H, E, A> &v)
    {
      return detail::MapToValue<std::unordered_map<K, V, H, E, A>, K, V>(v);
    }
    static std::expected<std::unordered_map<K, V, H, E, A>, Error> FromValue(const Value &v)
    {
      return detail::MapFromValue<std::unordered_map<K, V, H, E, A>, K, V>(v);
    }
  };

  template <class T>
  struct ValueTraits<std::optional<T>>
  {
    static Value ToValue(const std::optional<T> &v)
    {
      if (!v.has_value())
        return Value{};
      return ValueTraits<T>::ToValue(*v);
    }
    static std::expected<std::optional<T>, Error> FromValue(const Value &v)
    {
      if (v.IsNull())
        return std::optional<T>{};
      auto inner = ValueTraits<T>::FromValue(v);
      if (!inner)
        return std::unexpected(inner.error());
      return std::optional<T>{std::move(*inner)};
    }
  };

  // Shorthands
  template <class T>
  [[nodiscard]] Value ToValue(const T &v)
  {
    return ValueTraits<std::remove_cvref_t<T>>::ToValue(v);
  }

  template <class T>
  [[nodiscard]] std::expected<T, Error> FromValue(const Value &v)
  {
    return ValueTraits<std::remove_cvref_t<T>>::FromValue(v);
  }

} // namespace Serializable
