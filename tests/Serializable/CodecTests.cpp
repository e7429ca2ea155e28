// CodecTests.cpp - recursive encoder and decoder over the JSON IR

#include <catch2/catch_test_macros.hpp>

#include <Serializable/Serializable.hpp>

#include <cstdint>
#include <limits>

TEST_CASE("PrimitivesPassThroughUnchanged", "[serializable][Codec]")
{
  using namespace Serializable;

  CHECK(Encode(Value{}).value() == Ir(nullptr));
  CHECK(Encode(Value{true}).value() == Ir(true));
  CHECK(Encode(Value{-7}).value() == Ir(-7));
  CHECK(Encode(Value{0.25}).value() == Ir(0.25));
  CHECK(Encode(Value{"hi"}).value() == Ir("hi"));
  CHECK(IsPrimitive(Ir("hi")));
  CHECK_FALSE(IsPrimitive(Ir::array()));
}

TEST_CASE("ListsBecomeArrays", "[serializable][Codec]")
{
  using namespace Serializable;

  auto ir = Encode(List{1, "two", List{3.5, nullptr}});
  REQUIRE(ir.has_value());
  CHECK(*ir == Ir::parse(R"([1,"two",[3.5,null]])"));
}

TEST_CASE("TuplesAreTaggedWithTheBuiltinTupleClass", "[serializable][Codec]")
{
  using namespace Serializable;

  auto ir = Encode(Tuple{1, 2});
  REQUIRE(ir.has_value());
  CHECK(*ir == Ir::parse(R"({"__class__":{"__module__":"builtins","__name__":"tuple"},"__value__":[1,2]})"));

  auto back = Decode(*ir);
  REQUIRE(back.has_value());
  REQUIRE(back->IsTuple());
  CHECK(*back == Value{Tuple{1, 2}});
}

TEST_CASE("EmptyAndNestedTuplesRoundTrip", "[serializable][Codec]")
{
  using namespace Serializable;

  Value original = List{Tuple{}, Tuple{Tuple{1}, List{Tuple{"a", "b"}}}};
  auto ir = Encode(original);
  REQUIRE(ir.has_value());
  auto back = Decode(*ir);
  REQUIRE(back.has_value());
  CHECK(*back == original);
}

TEST_CASE("ClassValuesEncodeAsBareReferences", "[serializable][Codec]")
{
  using namespace Serializable;

  auto list = GetType("builtins.list");
  REQUIRE(list.has_value());
  auto ir = Encode(Value::FromType(*list));
  REQUIRE(ir.has_value());
  CHECK(*ir == Ir::parse(R"({"__module__":"builtins","__name__":"list"})"));

  auto back = Decode(*ir);
  REQUIRE(back.has_value());
  REQUIRE(back->IsClass());
  CHECK(back->AsClass() == *list);
}

TEST_CASE("ClassTagWithValueInvokesTheClass", "[serializable][Codec]")
{
  using namespace Serializable;

  auto back = Decode(Ir::parse(R"({"__class__":{"__module__":"builtins","__name__":"list"},"__value__":[1,2]})"));
  REQUIRE(back.has_value());
  REQUIRE(back->IsList());
  CHECK(*back == Value{List{1, 2}});

  auto asInt = Decode(Ir::parse(R"({"__class__":{"__module__":"builtins","__name__":"int"},"__value__":3})"));
  REQUIRE(asInt.has_value());
  CHECK(*asInt == Value{3});
}

TEST_CASE("PlainObjectsDecodeToDicts", "[serializable][Codec]")
{
  using namespace Serializable;

  auto back = Decode(Ir::parse(R"({"a":1,"b":[true,null]})"));
  REQUIRE(back.has_value());
  CHECK(*back == Value{Dict{{"a", 1}, {"b", List{true, nullptr}}}});
}

TEST_CASE("UnsignedBeyondSignedRangeIsMalformed", "[serializable][Codec]")
{
  using namespace Serializable;

  Ir big = std::numeric_limits<std::uint64_t>::max();
  auto r = Decode(big);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::MalformedRepresentation);

  Ir fits = static_cast<std::uint64_t>(12);
  auto ok = Decode(fits);
  REQUIRE(ok.has_value());
  CHECK(*ok == Value{12});
}

TEST_CASE("ReferenceWithNonStringMembersIsMalformed", "[serializable][Codec]")
{
  using namespace Serializable;

  auto r = Decode(Ir::parse(R"({"__module__":"builtins","__name__":3})"));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::MalformedRepresentation);

  auto noModule = Decode(Ir::parse(R"({"__name__":"list"})"));
  REQUIRE_FALSE(noModule.has_value());
  CHECK(noModule.error().code == ErrorCode::MalformedRepresentation);
}

TEST_CASE("NonClassTagFailsReconstruction", "[serializable][Codec]")
{
  using namespace Serializable;

  auto r = Decode(Ir::parse(R"({"__class__":5,"__value__":1})"));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::Reconstruction);
}

TEST_CASE("ErrorsInNestedElementsAbortTheWholeDecode", "[serializable][Codec]")
{
  using namespace Serializable;

  auto r = Decode(Ir::parse(R"([1,{"x":{"__module__":"no_such_root","__name__":"X"}}])"));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::Resolution);
}
