// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL hook to describe a serializable type
#pragma once

#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <Serializable/NameUtils.hpp>
#include <Serializable/Registry.hpp>
#include <Serializable/ValueTraits.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Serializable
{

  // ==== Invocation machinery ====
  namespace detail
  {
    template <class Tuple, std::size_t... I>
    inline void PushParamIds(NGIN::Containers::Vector<NGIN::UInt64> &v, std::index_sequence<I...>)
    {
      (v.PushBack(TypeIdOf<std::tuple_element_t<I, Tuple>>()), ...);
    }

    template <class R>
    inline Value ResultToValue(R &&r)
    {
      return ValueTraits<std::remove_cvref_t<R>>::ToValue(r);
    }

    // Converts args[0..N) to A...; conversion failures are InvalidArgument.
    template <class... A>
    std::expected<std::tuple<std::remove_cvref_t<A>...>, Error> ConvertArgs(const Value *args, NGIN::UIntSize count)
    {
      if (count != sizeof...(A))
      {
        std::string msg{"expected "};
        msg += std::to_string(sizeof...(A));
        msg += " argument(s), got ";
        msg += std::to_string(count);
        return std::unexpected(Error{ErrorCode::InvalidArgument, std::move(msg)});
      }
      return [&]<std::size_t... I>(std::index_sequence<I...>) -> std::expected<std::tuple<std::remove_cvref_t<A>...>, Error>
      {
        std::tuple<std::expected<std::remove_cvref_t<A>, Error>...> converted{
            ValueTraits<std::remove_cvref_t<A>>::FromValue(args[I])...};
        std::optional<Error> failure;
        ((std::get<I>(converted).has_value() || failure.has_value() ||
          (failure = std::get<I>(converted).error(), true)),
         ...);
        if (failure)
          return std::unexpected(std::move(*failure));
        return std::tuple<std::remove_cvref_t<A>...>{std::move(*std::get<I>(converted))...};
      }(std::index_sequence_for<A...>{});
    }

    template <class R, class... A, class Fn>
    ExpectedValue CallWithValues(Fn &&fn, const Value *args, NGIN::UIntSize count)
    {
      auto converted = ConvertArgs<A...>(args, count);
      if (!converted)
        return std::unexpected(converted.error());
      if constexpr (std::is_void_v<R>)
      {
        std::apply(fn, std::move(*converted));
        return Value{};
      }
      else
      {
        return ResultToValue(std::apply(fn, std::move(*converted)));
      }
    }

    template <class>
    struct FunctionPtrTraits;
    template <class R, class... A>
    struct FunctionPtrTraits<R (*)(A...)>
    {
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);

      template <auto Fn>
      static ExpectedValue Invoke(const Value *args, NGIN::UIntSize count)
      {
        return CallWithValues<R, A...>(Fn, args, count);
      }
    };
    template <class R, class... A>
    struct FunctionPtrTraits<R (*)(A...) noexcept> : FunctionPtrTraits<R (*)(A...)>
    {
    };

    template <auto MemberPtr>
    Value FieldLoad(const void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      return ValueTraits<std::remove_cv_t<M>>::ToValue(static_cast<const C *>(obj)->*MemberPtr);
    }

    template <auto MemberPtr>
    std::expected<void, Error> FieldStore(void *obj, const Value &value)
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      auto converted = ValueTraits<std::remove_cv_t<M>>::FromValue(value);
      if (!converted)
        return std::unexpected(converted.error());
      static_cast<C *>(obj)->*MemberPtr = std::move(*converted);
      return {};
    }

    template <class T>
    std::expected<Any, Error> AssignFieldsImpl(const Dict &fields)
    {
      const auto &reg = GetRegistry();
      const auto *idx = reg.byTypeId.GetPtr(TypeIdOf<T>());
      if (!idx)
        return std::unexpected(Error{ErrorCode::NotFound, "type not registered"});
      const auto &rec = reg.types[*idx];
      for (const auto &entry : fields)
      {
        NameId id{};
        if (!entry.key.IsString() || !FindNameId(entry.key.AsString(), id) || !rec.fieldIndex.GetPtr(id))
          return std::unexpected(Error{ErrorCode::InvalidArgument, "unknown field for " + std::string{rec.qualifiedName}});
      }
      T obj{};
      for (NGIN::UIntSize i = 0; i < rec.fields.Size(); ++i)
      {
        const auto &f = rec.fields[i];
        const Value *v = fields.Find(Value{f.name});
        if (!v)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "missing field '" + std::string{f.name} + "'"});
        auto stored = f.Store(&obj, *v);
        if (!stored)
          return std::unexpected(Error{stored.error().code, "field '" + std::string{f.name} + "': " + stored.error().message});
      }
      return Any{std::move(obj)};
    }

    template <class T>
    Value BoxAsValueImpl(const Any &instance)
    {
      return ValueTraits<T>::ToValue(instance.template Cast<T>());
    }
  } // namespace detail

  template <class T>
  class TypeBuilder
  {
  public:
    // Constructed by the registry when invoking the ADL hook; binds to a specific type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    // Dotted module path; defaults to the C++ namespace with "::" replaced by '.'.
    TypeBuilder &SetModule(std::string_view module)
    {
      const auto &rec = detail::GetRegistry().types[m_index];
      detail::RenameType(m_index, module, rec.name);
      return *this;
    }

    // Name within the module; may be dotted for nested types.
    TypeBuilder &SetName(std::string_view name)
    {
      const auto &rec = detail::GetRegistry().types[m_index];
      detail::RenameType(m_index, rec.moduleName, name);
      return *this;
    }

    // Add a public data member as a field; name optional and auto-derived if omitted.
    template <auto MemberPtr>
    TypeBuilder &Field(std::string_view name = {})
    {
      static_assert(std::is_same_v<detail::MemberClassT<MemberPtr>, T>, "Field must belong to T");
      auto &reg = detail::GetRegistry();
      detail::FieldRuntimeDesc f{};
      {
        auto svName = name.empty() ? detail::MemberNameFromPretty<MemberPtr>() : name;
        auto id = detail::InternNameId(svName);
        f.nameId = id;
        f.name = detail::NameFromId(id);
      }
      f.Load = &detail::FieldLoad<MemberPtr>;
      f.Store = &detail::FieldStore<MemberPtr>;
      auto &rec = reg.types[m_index];
      rec.fields.PushBack(std::move(f));
      const auto newIdx = static_cast<NGIN::UInt32>(rec.fields.Size() - 1);
      rec.fieldIndex.Insert(rec.fields[newIdx].nameId, newIdx);
      if constexpr (std::is_default_constructible_v<T>)
        rec.AssignFields = &detail::AssignFieldsImpl<T>;
      return *this;
    }

    // Add a constructor descriptor for T with parameter types A...; names enable keyword construction.
    template <class... A>
    TypeBuilder &Constructor(std::initializer_list<std::string_view> paramNames = {});

    // To-mapping capability: Fn is `R (T::*)() const` or `R (*)(const T&)`, R convertible to a Dict.
    template <auto Fn>
    TypeBuilder &ToFields()
    {
      auto &reg = detail::GetRegistry();
      reg.types[m_index].ToFields = [](const void *obj) -> std::expected<Dict, Error>
      {
        auto v = detail::ResultToValue(std::invoke(Fn, *static_cast<const T *>(obj)));
        if (!v.IsDict())
          return std::unexpected(Error{ErrorCode::UnencodableValue, "to-mapping did not produce a mapping"});
        return v.AsDict();
      };
      return *this;
    }

    // Construct-from-mapping capability: Fn is `T (*)(const Dict&)` or `std::expected<T, Error> (*)(const Dict&)`.
    template <auto Fn>
    TypeBuilder &FromFields()
    {
      auto &reg = detail::GetRegistry();
      reg.types[m_index].FromFields = [](const Dict &fields) -> std::expected<Any, Error>
      {
        using R = std::remove_cvref_t<decltype(std::invoke(Fn, fields))>;
        if constexpr (std::is_same_v<R, std::expected<T, Error>>)
        {
          auto r = std::invoke(Fn, fields);
          if (!r)
            return std::unexpected(r.error());
          return Any{std::move(*r)};
        }
        else
        {
          static_assert(std::is_same_v<R, T>, "FromFields must return T or std::expected<T, Error>");
          return Any{std::invoke(Fn, fields)};
        }
      };
      return *this;
    }

    // Instances constructed through the registry become the native Value for T
    // (List, Tuple, an Int...) instead of an Object.
    TypeBuilder &BoxAsValue()
    {
      detail::GetRegistry().types[m_index].Box = &detail::BoxAsValueImpl<T>;
      return *this;
    }

  private:
    NGIN::UInt32 m_index{0};
  };

  // ==== Constructor registration ====
  template <class T>
  template <class... A>
  inline TypeBuilder<T> &TypeBuilder<T>::Constructor(std::initializer_list<std::string_view> paramNames)
  {
    auto &reg = detail::GetRegistry();
    detail::CtorRuntimeDesc c{};
    if constexpr (sizeof...(A) > 0)
      detail::PushParamIds<std::tuple<A...>>(c.paramTypeIds, std::index_sequence_for<A...>{});
    for (auto n : paramNames)
      c.paramNames.PushBack(detail::NameFromId(detail::InternNameId(n)));
    c.Construct = [](const Value *args, NGIN::UIntSize count) -> std::expected<Any, Error>
    {
      auto converted = detail::ConvertArgs<A...>(args, count);
      if (!converted)
        return std::unexpected(converted.error());
      return std::apply(
          [](auto &&...a)
          {
            // Parentheses keep List/Tuple copies from matching their initializer_list constructors.
            if constexpr (std::is_constructible_v<T, decltype(a)...>)
              return Any{T(std::forward<decltype(a)>(a)...)};
            else
              return Any{T{std::forward<decltype(a)>(a)...}};
          },
          std::move(*converted));
    };
    reg.types[m_index].constructors.PushBack(std::move(c));
    return *this;
  }

  // ==== Function registration ====
  template <auto Fn>
  ExpectedFunction RegisterFunction(std::string_view module, std::string_view name,
                                    std::initializer_list<std::string_view> paramNames)
  {
    using Traits = detail::FunctionPtrTraits<decltype(Fn)>;
    detail::FunctionRuntimeDesc f{};
    f.address = static_cast<NGIN::UInt64>(reinterpret_cast<std::uintptr_t>(Fn));
    if constexpr (Traits::Arity > 0)
      detail::PushParamIds<typename Traits::Args>(f.paramTypeIds, std::make_index_sequence<Traits::Arity>{});
    f.Invoke = &Traits::template Invoke<Fn>;
    if (paramNames.size() != 0 && paramNames.size() != Traits::Arity)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "parameter name count does not match arity"});
    auto idx = detail::AddFunction(std::move(f), module, name, paramNames);
    if (!idx)
      return std::unexpected(idx.error());
    return Function{FunctionHandle{*idx}};
  }

} // namespace Serializable
