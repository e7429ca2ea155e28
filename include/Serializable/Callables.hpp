// Callables.hpp
// Turning C++ invocables into Values
#pragma once

#include <Serializable/Registry.hpp>
#include <Serializable/TypeBuilder.hpp>
#include <Serializable/Value.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

namespace Serializable
{

  namespace detail
  {
    template <class>
    struct CallOperatorTraits;
    template <class C, class R, class... A>
    struct CallOperatorTraits<R (C::*)(A...) const>
    {
      template <class F>
      static ExpectedValue Call(const F &f, std::span<const Value> args)
      {
        return CallWithValues<R, A...>(f, args.data(), args.size());
      }
    };
    template <class C, class R, class... A>
    struct CallOperatorTraits<R (C::*)(A...) const noexcept> : CallOperatorTraits<R (C::*)(A...) const>
    {
    };

    inline Value MakeCallable(CallableKind kind, std::string name, std::function<ExpectedValue(std::span<const Value>)> invoke)
    {
      auto state = std::make_shared<CallableState>();
      state->kind = kind;
      state->name = std::move(name);
      state->invoke = std::move(invoke);
      return Value{Callable{std::move(state)}};
    }
  } // namespace detail

  // A function registered with RegisterFunction becomes a Function value;
  // any other function pointer is an anonymous callable.
  template <class R, class... A>
  [[nodiscard]] Value FunctionValue(R (*fn)(A...))
  {
    const auto address = static_cast<NGIN::UInt64>(reinterpret_cast<std::uintptr_t>(fn));
    if (auto idx = detail::FindFunctionByAddress(address))
      return Value::FromFunction(Function{FunctionHandle{*idx}});
    return detail::MakeCallable(CallableKind::Anonymous, {},
                                [fn](std::span<const Value> args) -> ExpectedValue
                                { return detail::CallWithValues<R, A...>(fn, args.data(), args.size()); });
  }

  // Lambdas and function objects; state-carrying ones are closures.
  template <class F>
  requires requires { &std::remove_cvref_t<F>::operator(); }
  [[nodiscard]] Value CallableValue(F &&f, std::string name = {})
  {
    using D = std::remove_cvref_t<F>;
    using Traits = detail::CallOperatorTraits<decltype(&D::operator())>;
    constexpr auto kind = std::is_empty_v<D> ? CallableKind::Anonymous : CallableKind::Closure;
    return detail::MakeCallable(kind, std::move(name),
                                [fn = D(std::forward<F>(f))](std::span<const Value> args) -> ExpectedValue
                                { return Traits::Call(fn, args); });
  }

  // A const member function bound to a receiver.
  template <class C, class R, class... A>
  [[nodiscard]] Value BindMethod(C receiver, R (C::*method)(A...) const, std::string name = {})
  {
    return detail::MakeCallable(CallableKind::BoundMethod, std::move(name),
                                [receiver = std::move(receiver), method](std::span<const Value> args) -> ExpectedValue
                                {
                                  return detail::CallWithValues<R, A...>([&](A... a) -> decltype(auto)
                                                                         { return (receiver.*method)(std::forward<A>(a)...); },
                                                                         args.data(), args.size());
                                });
  }

} // namespace Serializable
