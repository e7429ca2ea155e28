#include <Serializable/Serializable.hpp>

#include <iostream>
#include <string>

namespace Demo {
  struct Point {
    int x{0};
    int y{0};

    friend void SerializableReflect(Serializable::Tag<Point>, Serializable::TypeBuilder<Point> &b) {
      b.SetModule("demo");
      b.Field<&Point::x>("x");
      b.Field<&Point::y>("y");
    }
  };

  int Scale(int v) { return v * 10; }
}

int main() {
  using namespace Serializable;
  std::cout << "Library: " << LibraryName() << "\n";

  (void)RegisterFunction<&Demo::Scale>("demo", "scale", {"v"});

  Dict data;
  data.Insert(Tuple{1, 2}, "pair key");
  data.Insert("origin", ToValue(Demo::Point{3, 4}));
  data.Insert("scale", FunctionValue(&Demo::Scale));

  auto text = ToJson(data);
  if (!text) {
    std::cout << "encode failed: " << ErrorCodeName(text.error().code) << ": " << text.error().message << "\n";
    return 1;
  }
  std::cout << "JSON: " << *text << "\n";

  auto back = FromJson(*text);
  if (!back) {
    std::cout << "decode failed: " << back.error().message << "\n";
    return 1;
  }
  std::cout << "round trip equal: " << std::boolalpha << (*back == Value{data}) << "\n";

  const Value *point = back->AsDict().Find(Value{"origin"});
  if (point && point->IsObject()) {
    if (const auto *p = point->AsObject().TryAs<Demo::Point>())
      std::cout << "Point: " << p->x << ", " << p->y << "\n";
  }

  int offset = 1;
  auto closure = ToJson(CallableValue([offset](int v) { return v + offset; }));
  if (!closure)
    std::cout << "closure rejected: " << ErrorCodeName(closure.error().code) << "\n";

  return 0;
}
