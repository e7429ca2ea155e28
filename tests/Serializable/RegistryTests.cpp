// RegistryTests.cpp - type and function registration, naming and construction

#include <catch2/catch_test_macros.hpp>

#include <Serializable/Serializable.hpp>

#include <string>
#include <variant>

namespace RegistryDemo::Shapes
{
  struct Square
  {
    int side{1};
  };

  struct Rect
  {
    int w{0};
    int h{0};
    Rect() = default;
    Rect(int w_, int h_) : w(w_), h(h_) {}

    friend bool operator==(const Rect &, const Rect &) = default;

    friend void SerializableReflect(Serializable::Tag<Rect>, Serializable::TypeBuilder<Rect> &b)
    {
      b.SetModule("shapes");
      b.Field<&Rect::w>("width");
      b.Field<&Rect::h>("height");
      b.Constructor<int, int>({"width", "height"});
    }
  };

  struct Handle
  {
    int id{0};
  };

  struct Thing
  {
    int id{0};

    friend void SerializableReflect(Serializable::Tag<Thing>, Serializable::TypeBuilder<Thing> &b)
    {
      b.SetModule("clash");
      b.SetName("thing");
    }
  };

  int MakeThing(int id) { return id; }

  int Area(int w, int h) { return w * h; }
  int Perimeter(int w, int h) { return 2 * (w + h); }
} // namespace RegistryDemo::Shapes

namespace RegistryDemo::Geo
{
  struct Outer
  {
    struct Inner
    {
      int v{0};
    };
    int w{0};
  };
} // namespace RegistryDemo::Geo

struct GlobalWidget
{
  int v{0};
};

namespace Serializable
{
  template <>
  struct Describe<RegistryDemo::Shapes::Handle>
  {
    static void Do(TypeBuilder<RegistryDemo::Shapes::Handle> &b)
    {
      b.SetModule("shapes");
      b.SetName("Outer.Handle");
      b.Field<&RegistryDemo::Shapes::Handle::id>();
    }
  };
} // namespace Serializable

TEST_CASE("DefaultNamesFollowTheNamespace", "[serializable][Registry]")
{
  using namespace Serializable;

  auto t = GetType<RegistryDemo::Shapes::Square>();
  CHECK(t.ModuleName() == "RegistryDemo.Shapes");
  CHECK(t.Name() == "Square");
  CHECK(t.QualifiedName() == "RegistryDemo.Shapes.Square");
  CHECK(t.FieldCount() == 0);

  auto g = GetType<GlobalWidget>();
  CHECK(g.ModuleName() == "__main__");
  CHECK(g.Name() == "GlobalWidget");
}

TEST_CASE("NestedTypesAreNamedInsideTheirEnclosingType", "[serializable][Registry]")
{
  using namespace Serializable;

  auto outer = GetType<RegistryDemo::Geo::Outer>();
  CHECK(outer.QualifiedName() == "RegistryDemo.Geo.Outer");
  auto inner = GetType<RegistryDemo::Geo::Outer::Inner>();
  CHECK(inner.ModuleName() == "RegistryDemo.Geo");
  CHECK(inner.Name() == "Outer.Inner");

  auto r = Resolve("RegistryDemo.Geo", "Outer.Inner");
  REQUIRE(r.has_value());
  CHECK(std::get<Type>(*r) == inner);
}

TEST_CASE("RegisteredTypesAreFoundByPath", "[serializable][Registry]")
{
  using namespace Serializable;

  auto t = GetType<RegistryDemo::Shapes::Rect>();
  CHECK(t.QualifiedName() == "shapes.Rect");
  auto found = GetType("shapes.Rect");
  REQUIRE(found.has_value());
  CHECK(*found == t);
  CHECK(TryGetType<RegistryDemo::Shapes::Rect>().has_value());

  auto missing = GetType("shapes.Nope");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);
  CHECK_FALSE(FindType("shapes.Nope").has_value());
}

TEST_CASE("DescribeSpecializationNamesNestedType", "[serializable][Registry]")
{
  using namespace Serializable;

  auto t = GetType<RegistryDemo::Shapes::Handle>();
  CHECK(t.ModuleName() == "shapes");
  CHECK(t.Name() == "Outer.Handle");
  CHECK(t.QualifiedName() == "shapes.Outer.Handle");
  REQUIRE(t.FieldCount() == 1);
  CHECK(t.FieldAt(0).Name() == "id");
}

TEST_CASE("FieldsLoadAndStoreThroughValues", "[serializable][Registry]")
{
  using namespace Serializable;
  using RegistryDemo::Shapes::Rect;

  auto t = GetType<Rect>();
  auto width = t.GetField("width");
  REQUIRE(width.has_value());
  CHECK_FALSE(t.FindField("w").has_value());

  Rect r{3, 4};
  CHECK(width->Load(&r) == Value{3});
  REQUIRE(width->Store(&r, Value{9}).has_value());
  CHECK(r.w == 9);

  auto bad = width->Store(&r, Value{"wide"});
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::InvalidArgument);
  CHECK(r.w == 9);
}

TEST_CASE("ConstructorsAcceptPositionalAndNamedArguments", "[serializable][Registry]")
{
  using namespace Serializable;
  using RegistryDemo::Shapes::Rect;

  auto t = GetType<Rect>();
  REQUIRE(t.ConstructorCount() == 2);

  Value args[] = {Value{2}, Value{5}};
  auto positional = t.Construct(args);
  REQUIRE(positional.has_value());
  REQUIRE(positional->IsObject());
  const Rect *p = positional->AsObject().TryAs<Rect>();
  REQUIRE(p != nullptr);
  CHECK(*p == Rect{2, 5});

  auto named = t.ConstructNamed(Dict{{"height", 8}, {"width", 1}});
  REQUIRE(named.has_value());
  CHECK(*named->AsObject().TryAs<Rect>() == Rect{1, 8});

  Value one[] = {Value{1}};
  auto wrongArity = t.Construct(one);
  REQUIRE_FALSE(wrongArity.has_value());
}

TEST_CASE("FieldMappingFollowsRegistrationOrder", "[serializable][Registry]")
{
  using namespace Serializable;
  using RegistryDemo::Shapes::Rect;

  Rect r{6, 7};
  auto mapping = GetType<Rect>().FieldMapping(&r);
  REQUIRE(mapping.has_value());
  REQUIRE(mapping->Size() == 2);
  CHECK(mapping->EntryAt(0).key == Value{"width"});
  CHECK(mapping->EntryAt(1).value == Value{7});
}

TEST_CASE("FunctionsRegisterUnderModulePaths", "[serializable][Registry]")
{
  using namespace Serializable;

  static const auto area = RegisterFunction<&RegistryDemo::Shapes::Area>("shapes.math", "area", {"w", "h"});
  REQUIRE(area.has_value());
  CHECK(area->QualifiedName() == "shapes.math.area");
  CHECK(area->ParameterCount() == 2);
  CHECK(area->ParameterName(1) == "h");

  auto found = GetFunction("shapes.math.area");
  REQUIRE(found.has_value());
  CHECK(*found == *area);

  Value args[] = {Value{3}, Value{4}};
  CHECK(found->Invoke(args).value() == Value{12});
  CHECK(found->InvokeNamed(Dict{{"h", 2}, {"w", 5}}).value() == Value{10});

  auto missingArg = found->InvokeNamed(Dict{{"w", 5}});
  REQUIRE_FALSE(missingArg.has_value());
}

TEST_CASE("DuplicateFunctionPathIsRejected", "[serializable][Registry]")
{
  using namespace Serializable;

  static const auto first = RegisterFunction<&RegistryDemo::Shapes::Perimeter>("shapes.math", "perimeter");
  REQUIRE(first.has_value());
  auto again = RegisterFunction<&RegistryDemo::Shapes::Area>("shapes.math", "perimeter");
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().code == ErrorCode::InvalidArgument);

  auto badNames = RegisterFunction<&RegistryDemo::Shapes::Area>("shapes.math", "area2", {"only"});
  REQUIRE_FALSE(badNames.has_value());
  CHECK(badNames.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("BuiltinTypesAreAvailable", "[serializable][Registry]")
{
  using namespace Serializable;

  for (const char *path : {"builtins.tuple", "builtins.list", "builtins.dict", "builtins.int", "builtins.float",
                           "builtins.str", "builtins.bool"})
  {
    INFO(path);
    CHECK(FindType(path).has_value());
  }
}

TEST_CASE("TypeCannotTakeAFunctionPath", "[serializable][Registry]")
{
  using namespace Serializable;

  static const auto make = RegisterFunction<&RegistryDemo::Shapes::MakeThing>("clash", "thing");
  REQUIRE(make.has_value());
  auto thing = GetType<RegistryDemo::Shapes::Thing>();
  CHECK(thing.QualifiedName() == "clash.thing");
  CHECK_FALSE(FindType("clash.thing").has_value());

  auto r = Resolve("clash", "thing");
  REQUIRE(r.has_value());
  REQUIRE(std::holds_alternative<Function>(*r));
  CHECK(std::get<Function>(*r) == *make);
  CHECK(Resolve(BuildReference(*make)).has_value());
}
