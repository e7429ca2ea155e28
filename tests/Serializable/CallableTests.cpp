// CallableTests.cpp - registered functions travel by reference; other callables are rejected

#include <catch2/catch_test_macros.hpp>

#include <Serializable/Serializable.hpp>

#include <string>

namespace MathLib
{
  int Add(int a, int b) { return a + b; }
  int Square(int v) { return v * v; }
  int Negate(int v) { return -v; }

  struct Counter
  {
    int base{10};
    int Plus(int v) const { return base + v; }
  };

  void EnsureRegistered()
  {
    static const bool once = []
    {
      (void)Serializable::RegisterFunction<&Add>("mathlib", "add", {"a", "b"});
      (void)Serializable::RegisterFunction<&Square>("mathlib", "square", {"v"});
      return true;
    }();
    (void)once;
  }
} // namespace MathLib

TEST_CASE("RegisteredFunctionEncodesAsReference", "[serializable][Callable]")
{
  using namespace Serializable;
  MathLib::EnsureRegistered();

  Value fn = FunctionValue(&MathLib::Add);
  REQUIRE(fn.IsFunction());
  CHECK(fn.AsFunction().QualifiedName() == "mathlib.add");

  auto text = ToJson(fn);
  REQUIRE(text.has_value());
  CHECK(*text == R"({"__module__":"mathlib","__name__":"add"})");

  auto back = FromJson(*text);
  REQUIRE(back.has_value());
  CHECK(*back == fn);

  Value args[] = {Value{2}, Value{3}};
  CHECK(back->AsFunction().Invoke(args).value() == Value{5});
}

TEST_CASE("FunctionReferenceAsClassTagIsInvoked", "[serializable][Callable]")
{
  using namespace Serializable;
  MathLib::EnsureRegistered();

  auto positional = FromJson(R"({"__class__":{"__module__":"mathlib","__name__":"square"},"__value__":4})");
  REQUIRE(positional.has_value());
  CHECK(*positional == Value{16});

  auto named = FromJson(R"({"__class__":{"__module__":"mathlib","__name__":"add"},"a":2,"b":5})");
  REQUIRE(named.has_value());
  CHECK(*named == Value{7});

  auto bad = FromJson(R"({"__class__":{"__module__":"mathlib","__name__":"add"},"a":2})");
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::Reconstruction);
}

TEST_CASE("ClosuresAreRejected", "[serializable][Callable]")
{
  using namespace Serializable;

  int offset = 3;
  Value closure = CallableValue([offset](int v) { return v + offset; }, "shift");
  REQUIRE(closure.IsCallable());
  CHECK(closure.AsCallable().Kind() == CallableKind::Closure);

  Value args[] = {Value{1}};
  CHECK(closure.AsCallable().Invoke(args).value() == Value{4});

  auto r = ToJson(closure);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::UnserializableClosure);

  auto nested = ToJson(List{1, Dict{{"f", closure}}});
  REQUIRE_FALSE(nested.has_value());
  CHECK(nested.error().code == ErrorCode::UnserializableClosure);
}

TEST_CASE("UnregisteredAndBoundCallablesAreRejected", "[serializable][Callable]")
{
  using namespace Serializable;

  Value stateless = CallableValue([](int v) { return v * 2; });
  CHECK(stateless.AsCallable().Kind() == CallableKind::Anonymous);
  CHECK(ToJson(stateless).error().code == ErrorCode::UnserializableCallable);

  Value unregistered = FunctionValue(&MathLib::Negate);
  REQUIRE(unregistered.IsCallable());
  Value args[] = {Value{5}};
  CHECK(unregistered.AsCallable().Invoke(args).value() == Value{-5});
  CHECK(ToJson(unregistered).error().code == ErrorCode::UnserializableCallable);

  Value bound = BindMethod(MathLib::Counter{}, &MathLib::Counter::Plus, "plus");
  CHECK(bound.AsCallable().Kind() == CallableKind::BoundMethod);
  CHECK(bound.AsCallable().Invoke(args).value() == Value{15});
  CHECK(ToJson(bound).error().code == ErrorCode::UnserializableCallable);
}

TEST_CASE("CallableArgumentsAreChecked", "[serializable][Callable]")
{
  using namespace Serializable;

  Value fn = CallableValue([](int a, std::string b) { return b + std::to_string(a); });
  Value good[] = {Value{1}, Value{"n"}};
  CHECK(fn.AsCallable().Invoke(good).value() == Value{"n1"});

  Value tooFew[] = {Value{1}};
  auto arity = fn.AsCallable().Invoke(tooFew);
  REQUIRE_FALSE(arity.has_value());
  CHECK(arity.error().code == ErrorCode::InvalidArgument);

  Value wrongKind[] = {Value{"x"}, Value{"n"}};
  CHECK_FALSE(fn.AsCallable().Invoke(wrongKind).has_value());
}
