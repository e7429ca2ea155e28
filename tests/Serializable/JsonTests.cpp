// JsonTests.cpp - text codec on top of the encoder and decoder

#include <catch2/catch_test_macros.hpp>

#include <Serializable/Serializable.hpp>

#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

TEST_CASE("TextIsCompactJson", "[serializable][Json]")
{
  using namespace Serializable;

  auto text = ToJson(List{1, "a", nullptr, true, 1.5});
  REQUIRE(text.has_value());
  CHECK(*text == R"([1,"a",null,true,1.5])");
}

TEST_CASE("MixedKeyDictionaryRoundTrips", "[serializable][Json]")
{
  using namespace Serializable;

  Value original = Dict{{Tuple{1, 2}, "a"}, {"b", 3}};
  auto text = ToJson(original);
  REQUIRE(text.has_value());
  CHECK(*text == R"({"__serialized_keys__element_0":"a","b":3,"__serialized_keys__":)"
                 R"(["{\"__class__\":{\"__module__\":\"builtins\",\"__name__\":\"tuple\"},\"__value__\":[1,2]}"]})");

  auto back = FromJson(*text);
  REQUIRE(back.has_value());
  CHECK(*back == original);
}

TEST_CASE("ReencodingDecodedTextIsIdempotent", "[serializable][Json]")
{
  using namespace Serializable;

  Value original = List{Dict{{Tuple{1, 2}, List{Tuple{}}}, {"k", Dict{{3, 4}}}}, Tuple{"x", 1.25}};
  auto first = ToJson(original);
  REQUIRE(first.has_value());
  auto decoded = FromJson(*first);
  REQUIRE(decoded.has_value());
  auto second = ToJson(*decoded);
  REQUIRE(second.has_value());
  CHECK(*first == *second);
}

TEST_CASE("IntegersAndFloatsStayDistinct", "[serializable][Json]")
{
  using namespace Serializable;

  auto asFloat = FromJson("1.0");
  REQUIRE(asFloat.has_value());
  CHECK(asFloat->IsFloat());

  auto asInt = FromJson("1");
  REQUIRE(asInt.has_value());
  CHECK(asInt->IsInt());
}

TEST_CASE("InvalidTextIsMalformed", "[serializable][Json]")
{
  using namespace Serializable;

  for (const char *text : {"", "[1,", "{\"a\":}", "nope", "[1] trailing"})
  {
    INFO(text);
    auto r = FromJson(text);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::MalformedRepresentation);
  }
}

TEST_CASE("NonFiniteFloatsPrintAsNull", "[serializable][Json]")
{
  using namespace Serializable;

  auto nan = ToJson(Value{std::numeric_limits<double>::quiet_NaN()});
  REQUIRE(nan.has_value());
  CHECK(*nan == "null");

  auto inf = ToJson(Value{std::numeric_limits<double>::infinity()});
  REQUIRE(inf.has_value());
  CHECK(*inf == "null");
}

TEST_CASE("InvalidUtf8IsReplacedInsteadOfFailing", "[serializable][Json]")
{
  using namespace Serializable;

  auto text = ToJson(Value{std::string{"a\xff"}});
  REQUIRE(text.has_value());
  CHECK(text->front() == '"');
}

TEST_CASE("TypedHelpersConvertNativeContainers", "[serializable][Json]")
{
  using namespace Serializable;

  auto list = ToJson(std::vector<int>{1, 2, 3});
  REQUIRE(list.has_value());
  CHECK(*list == "[1,2,3]");

  auto counts = FromJson<std::map<std::string, int>>(R"({"a":1,"b":2})");
  REQUIRE(counts.has_value());
  CHECK(counts->at("a") == 1);
  CHECK(counts->at("b") == 2);

  auto pairText = ToJson(std::pair<int, std::string>{7, "seven"});
  REQUIRE(pairText.has_value());
  auto pair = FromJson<std::pair<int, std::string>>(*pairText);
  REQUIRE(pair.has_value());
  CHECK(pair->first == 7);
  CHECK(pair->second == "seven");

  auto wrong = FromJson<std::vector<int>>(R"(["a"])");
  REQUIRE_FALSE(wrong.has_value());
  CHECK(wrong.error().code == ErrorCode::InvalidArgument);
}
