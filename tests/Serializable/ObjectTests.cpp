// ObjectTests.cpp - encoding and reconstruction of registered user types

#include <catch2/catch_test_macros.hpp>

#include <Serializable/Serializable.hpp>

#include <string>
#include <vector>

namespace Geometry
{
  struct Point
  {
    int x{0};
    int y{0};

    Serializable::Dict ToDict() const { return Serializable::Dict{{"x", x}, {"y", y}}; }

    friend bool operator==(const Point &, const Point &) = default;

    friend void SerializableReflect(Serializable::Tag<Point>, Serializable::TypeBuilder<Point> &b)
    {
      b.SetModule("geometry");
      b.Field<&Point::x>("x");
      b.Field<&Point::y>("y");
      b.ToFields<&Point::ToDict>();
    }
  };

  // No operator==: compared through its field mapping.
  struct Segment
  {
    Point from;
    Point to;

    friend void SerializableReflect(Serializable::Tag<Segment>, Serializable::TypeBuilder<Segment> &b)
    {
      b.SetModule("geometry");
      b.Field<&Segment::from>();
      b.Field<&Segment::to>();
    }
  };
} // namespace Geometry

namespace Bank
{
  struct Account
  {
    std::string owner;
    int balance;

    Account(std::string o, int b) : owner(std::move(o)), balance(b) {}

    friend bool operator==(const Account &, const Account &) = default;

    friend void SerializableReflect(Serializable::Tag<Account>, Serializable::TypeBuilder<Account> &b)
    {
      b.SetModule("bank");
      b.Field<&Account::owner>("owner");
      b.Field<&Account::balance>("balance");
      b.Constructor<std::string, int>({"owner", "balance"});
    }
  };
} // namespace Bank

namespace Weather
{
  struct Temperature
  {
    double celsius{0.0};

    friend bool operator==(const Temperature &, const Temperature &) = default;
  };

  Serializable::Dict ToKelvin(const Temperature &t)
  {
    return Serializable::Dict{{"kelvin", t.celsius + 273.15}};
  }

  std::expected<Temperature, Serializable::Error> FromKelvin(const Serializable::Dict &fields)
  {
    const auto *k = fields.Find(Serializable::Value{"kelvin"});
    if (!k || !k->IsFloat())
      return std::unexpected(Serializable::Error{Serializable::ErrorCode::InvalidArgument, "kelvin missing"});
    return Temperature{k->AsFloat() - 273.15};
  }

  struct Opaque
  {
    int hidden{7};
  };
} // namespace Weather

namespace Serializable
{
  template <>
  struct Describe<Weather::Temperature>
  {
    static void Do(TypeBuilder<Weather::Temperature> &b)
    {
      b.SetModule("weather");
      b.ToFields<&Weather::ToKelvin>();
      b.FromFields<&Weather::FromKelvin>();
    }
  };

  template <>
  struct Describe<Weather::Opaque>
  {
    static void Do(TypeBuilder<Weather::Opaque> &b)
    {
      b.SetModule("weather");
    }
  };
} // namespace Serializable

TEST_CASE("PointEncodesFieldsFollowedByClassTag", "[serializable][Object]")
{
  using namespace Serializable;
  using Geometry::Point;

  auto text = ToJson(Point{1, 2});
  REQUIRE(text.has_value());
  CHECK(*text == R"({"x":1,"y":2,"__class__":{"__module__":"geometry","__name__":"Point"}})");
}

TEST_CASE("PointRoundTripsToEqualPoint", "[serializable][Object]")
{
  using namespace Serializable;
  using Geometry::Point;

  auto text = ToJson(Point{-4, 9});
  REQUIRE(text.has_value());
  auto back = FromJson<Point>(*text);
  REQUIRE(back.has_value());
  CHECK(*back == Point{-4, 9});
}

TEST_CASE("ObjectsRoundTripInsideContainers", "[serializable][Object]")
{
  using namespace Serializable;
  using Geometry::Point;

  Value original = List{ToValue(Point{1, 1}), Dict{{"origin", ToValue(Point{})}}, Tuple{ToValue(Point{2, 3}), 4}};
  auto text = ToJson(original);
  REQUIRE(text.has_value());
  auto back = FromJson(*text);
  REQUIRE(back.has_value());
  CHECK(*back == original);
}

TEST_CASE("NestedObjectsWithoutEqualityCompareByFields", "[serializable][Object]")
{
  using namespace Serializable;
  using Geometry::Point;
  using Geometry::Segment;

  Value original = ToValue(Segment{Point{0, 0}, Point{3, 4}});
  auto text = ToJson(original);
  REQUIRE(text.has_value());
  CHECK(*text == R"({"from":{"x":0,"y":0,"__class__":{"__module__":"geometry","__name__":"Point"}},)"
                 R"("to":{"x":3,"y":4,"__class__":{"__module__":"geometry","__name__":"Point"}},)"
                 R"("__class__":{"__module__":"geometry","__name__":"Segment"}})");
  auto back = FromJson(*text);
  REQUIRE(back.has_value());
  CHECK(*back == original);
  CHECK_FALSE(*back == ToValue(Segment{Point{0, 0}, Point{3, 5}}));
}

TEST_CASE("KeywordConstructorReceivesFieldsByName", "[serializable][Object]")
{
  using namespace Serializable;
  using Bank::Account;

  (void)GetType<Account>();
  auto back = FromJson<Account>(R"({"balance":10,"owner":"ada","__class__":{"__module__":"bank","__name__":"Account"}})");
  REQUIRE(back.has_value());
  CHECK(back->owner == "ada");
  CHECK(back->balance == 10);

  auto text = ToJson(Account{"bob", 3});
  REQUIRE(text.has_value());
  auto again = FromJson<Account>(*text);
  REQUIRE(again.has_value());
  CHECK(*again == Account{"bob", 3});
}

TEST_CASE("FromMappingFactoryTakesPrecedenceOverKeywords", "[serializable][Object]")
{
  using namespace Serializable;
  using Weather::Temperature;

  auto text = ToJson(Temperature{25.0});
  REQUIRE(text.has_value());
  auto ir = JsonParse(*text);
  REQUIRE(ir.has_value());
  CHECK(ir->contains("kelvin"));
  CHECK((*ir)["__class__"]["__module__"] == "weather");

  auto back = FromJson<Temperature>(*text);
  REQUIRE(back.has_value());
  CHECK(back->celsius > 24.999);
  CHECK(back->celsius < 25.001);
}

TEST_CASE("ObjectWithoutMappingOrFieldsIsUnencodable", "[serializable][Object]")
{
  using namespace Serializable;

  auto r = ToJson(Weather::Opaque{});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::UnencodableValue);

  auto nested = ToJson(List{1, ToValue(Weather::Opaque{})});
  REQUIRE_FALSE(nested.has_value());
  CHECK(nested.error().code == ErrorCode::UnencodableValue);
}

TEST_CASE("MissingOrUnknownFieldsFailReconstruction", "[serializable][Object]")
{
  using namespace Serializable;

  (void)GetType<Geometry::Point>();
  auto missing = FromJson(R"({"x":1,"__class__":{"__module__":"geometry","__name__":"Point"}})");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::Reconstruction);

  auto unknown = FromJson(R"({"x":1,"y":2,"z":3,"__class__":{"__module__":"geometry","__name__":"Point"}})");
  REQUIRE_FALSE(unknown.has_value());
  CHECK(unknown.error().code == ErrorCode::Reconstruction);

  auto mistyped = FromJson(R"({"x":"one","y":2,"__class__":{"__module__":"geometry","__name__":"Point"}})");
  REQUIRE_FALSE(mistyped.has_value());
  CHECK(mistyped.error().code == ErrorCode::Reconstruction);
}

TEST_CASE("ClassTagMustReferenceClassOrFunction", "[serializable][Object]")
{
  using namespace Serializable;

  auto r = FromJson(R"({"x":1,"__class__":"geometry.Point"})");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::Reconstruction);
}
