#include "core/cache_class.hpp"
#include <gtest/gtest.h>

#include <memory>

using namespace mk::core;

namespace {

auto build(CacheClassBuilder &builder) -> std::shared_ptr<const CacheClass> {
  auto cls = std::move(builder).build();
  EXPECT_TRUE(cls.has_value()) << (cls ? "" : cls.error().message);
  return cls ? *cls : nullptr;
}

struct Point : CacheHost {
  Point(std::shared_ptr<const CacheClass> cls, double x, double y)
      : CacheHost(std::move(cls)), x(x), y(y) {}

  double x;
  double y;
};

}  // namespace

TEST(CacheClass, PropertyComputedOnce) {
  int ncalls = 0;
  CacheClassBuilder builder("T");
  builder.property("x", [&](const CacheHost &) {
    ++ncalls;
    return 1;
  });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(ncalls, 0);
  ASSERT_EQ(*t.get("x"), Value(1));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.get("x"), Value(1));
  ASSERT_EQ(ncalls, 1);
}

TEST(CacheClass, PropertyCachedPerInstance) {
  int ncalls = 0;
  CacheClassBuilder builder("T");
  builder.property("x", [&](const CacheHost &) { return ++ncalls; }).cache({"x"});
  auto cls = build(builder);

  CacheHost a(cls);
  CacheHost b(cls);
  ASSERT_EQ(*a.get("x"), Value(1));
  ASSERT_EQ(*b.get("x"), Value(2));
  ASSERT_EQ(*a.get("x"), Value(1));
}

TEST(CacheClass, UncachedPropertyRunsEveryTime) {
  int ncalls = 0;
  CacheClassBuilder builder("T");
  builder.property("x", [&](const CacheHost &) { return ++ncalls; });
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(*t.get("x"), Value(1));
  ASSERT_EQ(*t.get("x"), Value(2));
  ASSERT_FALSE(cls->is_cached("x"));
}

TEST(CacheClass, TypedPropertyReadsHostFields) {
  CacheClassBuilder builder("Point");
  builder.property<Point>("norm2", [](const Point &p) { return p.x * p.x + p.y * p.y; }).cache({"norm2"});
  auto cls = build(builder);

  Point p(cls, 3.0, 4.0);
  ASSERT_EQ(*p.get("norm2"), Value(25.0));
}

TEST(CacheClass, TypedPropertyOnWrongHostIsUsageError) {
  CacheClassBuilder builder("Point");
  builder.property<Point>("norm2", [](const Point &p) { return p.x * p.x + p.y * p.y; });
  auto cls = build(builder);

  CacheHost plain(cls);
  auto value = plain.get("norm2");
  ASSERT_FALSE(value.has_value());
  ASSERT_EQ(value.error().code, ErrorCode::Usage);
}

TEST(CacheClass, SetPropertyIsRejected) {
  CacheClassBuilder builder("T");
  builder.property("x", [](const CacheHost &) { return 1; }).cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  auto result = t.set("x", Value(1));
  ASSERT_FALSE(result.has_value());
  ASSERT_EQ(result.error().code, ErrorCode::IllegalMutation);
}

TEST(CacheClass, DeletePropertyIsRejected) {
  CacheClassBuilder builder("T");
  builder.property("x", [](const CacheHost &) { return 1; }).cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(*t.get("x"), Value(1));
  auto result = t.del("x");
  ASSERT_FALSE(result.has_value());
  ASSERT_EQ(result.error().code, ErrorCode::IllegalMutation);
  ASSERT_EQ(*t.get("x"), Value(1));
}

TEST(CacheClass, MethodWithoutArgs) {
  int ncalls = 0;
  CacheClassBuilder builder("T");
  builder.method("x", std::vector<std::string>{}, [&](const CacheHost &) {
    ++ncalls;
    return 1;
  });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(ncalls, 0);
  ASSERT_EQ(*t.call_with("x"), Value(1));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.call_with("x"), Value(1));
  ASSERT_EQ(ncalls, 1);
}

TEST(CacheClass, MethodWithArgs) {
  int ncalls = 0;
  auto signature = Signature::create({param("a"), param("b")});
  ASSERT_TRUE(signature.has_value());
  CacheClassBuilder builder("T");
  builder.method("x", std::move(*signature), [&](const CacheHost &, const BoundArguments &bound) {
    ++ncalls;
    return Value(BigInt(bound.value(0).as<BigInt>() + bound.value(1).as<BigInt>()));
  });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(ncalls, 0);
  ASSERT_EQ(*t.call_with("x", 1, 2), Value(3));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.call("x", CallArgs{{}, {{"a", 1}, {"b", 2}}}), Value(3));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.call_with("x", 2, 2), Value(4));
  ASSERT_EQ(ncalls, 2);
  ASSERT_EQ(*t.call("x", CallArgs{{}, {{"a", 2}, {"b", 2}}}), Value(4));
  ASSERT_EQ(ncalls, 2);
  ASSERT_EQ(*t.call_with("x", 1, 2), Value(3));
  ASSERT_EQ(ncalls, 2);
  ASSERT_EQ(t.slots().call_count(0), 2u);
}

TEST(CacheClass, MethodWithArgsAndPreprocessors) {
  int ncalls = 0;
  CacheClassBuilder builder("T");
  builder.method("x", {"a", "b"}, [&](const CacheHost &, BigInt a, BigInt b) {
    ++ncalls;
    return BigInt(a + b);
  });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(*t.call_with("x", 1, 2), Value(3));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.call("x", CallArgs{{}, {{"a", "1"}, {"b", "2"}}}), Value(3));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.call_with("x", "2", "2"), Value(4));
  ASSERT_EQ(ncalls, 2);
  ASSERT_EQ(*t.call("x", CallArgs{{}, {{"a", 2}, {"b", 2}}}), Value(4));
  ASSERT_EQ(ncalls, 2);
}

TEST(CacheClass, MethodWithKwargs) {
  int ncalls = 0;
  auto signature = Signature::create({param("a"), var_keyword("kwargs")});
  ASSERT_TRUE(signature.has_value());
  CacheClassBuilder builder("T");
  builder.method("x", std::move(*signature), [&](const CacheHost &, BigInt a, Dict kwargs) {
    ++ncalls;
    BigInt total = a;
    for (const auto &entry : kwargs.entries()) {
      total += entry.value.as<BigInt>();
    }
    return total;
  });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(*t.call("x", CallArgs{{1}, {{"b", 2}}}), Value(3));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.call("x", CallArgs{{}, {{"a", 1}, {"b", 2}}}), Value(3));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.call("x", CallArgs{{1}, {{"b", 2}, {"c", 3}}}), Value(6));
  ASSERT_EQ(ncalls, 2);
  ASSERT_EQ(*t.call("x", CallArgs{{}, {{"c", 3}, {"a", 1}, {"b", 2}}}), Value(6));
  ASSERT_EQ(ncalls, 2);
}

TEST(CacheClass, MethodBindingErrorsAreNotCached) {
  int ncalls = 0;
  CacheClassBuilder builder("T");
  builder.method("x", {"a"}, [&](const CacheHost &, Value a) {
    ++ncalls;
    return a;
  });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  auto result = t.call_with("x", 1, 2);
  ASSERT_FALSE(result.has_value());
  ASSERT_EQ(result.error().code, ErrorCode::Usage);
  ASSERT_EQ(ncalls, 0);
}

TEST(CacheClass, MethodWithUnhashableArgumentFails) {
  CacheClassBuilder builder("T");
  builder.method("x", {"a"}, [](const CacheHost &, Value a) { return a; });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  auto result = t.call_with("x", List{1});
  ASSERT_FALSE(result.has_value());
  ASSERT_EQ(result.error().code, ErrorCode::Unhashable);
}

TEST(CacheClass, FailedComputationIsNotStored) {
  int ncalls = 0;
  CacheClassBuilder builder("T");
  builder.property("x", [&](const CacheHost &) -> Expected<Value> {
    if (++ncalls == 1) {
      return tl::unexpected(make_error(ErrorCode::Validation, "first try fails"));
    }
    return Value(ncalls);
  });
  builder.cache({"x"});
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_FALSE(t.get("x").has_value());
  ASSERT_EQ(*t.get("x"), Value(2));
  ASSERT_EQ(*t.get("x"), Value(2));
}

TEST(CacheClass, SubclassRedefinedProperty) {
  CacheClassBuilder base_builder("T");
  base_builder.property("x", [](const CacheHost &) { return 1; }).cache({"x"});
  auto base = build(base_builder);

  CacheClassBuilder derived_builder("U");
  derived_builder.extends(base)
      .property("x",
                [base](const CacheHost &self) -> Expected<Value> {
                  auto inherited = base->get(self, "x");
                  if (!inherited) {
                    return tl::unexpected(inherited.error());
                  }
                  return Value(BigInt(inherited->as<BigInt>() + 1));
                })
      .property("y", [base](const CacheHost &self) { return base->get(self, "x"); })
      .cache({"x"});
  auto derived = build(derived_builder);
  ASSERT_EQ(derived->slot_count(), 2u);
  ASSERT_TRUE(derived->is_subclass_of(*base));
  ASSERT_FALSE(base->is_subclass_of(*derived));

  CacheHost u1(derived);
  ASSERT_EQ(*u1.get("x"), Value(2));
  ASSERT_EQ(*u1.get("y"), Value(1));

  CacheHost u2(derived);
  ASSERT_EQ(*u2.get("y"), Value(1));
  ASSERT_EQ(*u2.get("x"), Value(2));
}

TEST(CacheClass, SubclassInheritsMembers) {
  CacheClassBuilder base_builder("T");
  base_builder.field("label", "base").property("x", [](const CacheHost &) { return 1; }).cache({"x"});
  auto base = build(base_builder);

  CacheClassBuilder derived_builder("U");
  derived_builder.extends(base);
  auto derived = build(derived_builder);

  CacheHost u(derived);
  ASSERT_EQ(*u.get("label"), Value("base"));
  ASSERT_EQ(*u.get("x"), Value(1));
  ASSERT_TRUE(derived->is_cached("x"));
}

TEST(CacheClass, MissingAttribute) {
  CacheClassBuilder builder("T");
  builder.cache({"x"});
  auto cls = std::move(builder).build();
  ASSERT_FALSE(cls.has_value());
  ASSERT_EQ(cls.error().code, ErrorCode::Usage);
  ASSERT_EQ(cls.error().message, "attribute listed in cache is undefined: x");
}

TEST(CacheClass, InvalidAttribute) {
  CacheClassBuilder builder("T");
  builder.field("x", None).cache({"x"});
  auto cls = std::move(builder).build();
  ASSERT_FALSE(cls.has_value());
  ASSERT_EQ(cls.error().code, ErrorCode::Usage);
  ASSERT_EQ(cls.error().message, "don't know how to cache attribute x: field");
}

TEST(CacheClass, DuplicateAttribute) {
  CacheClassBuilder builder("T");
  builder.field("x", 1).field("x", 2);
  auto cls = std::move(builder).build();
  ASSERT_FALSE(cls.has_value());
  ASSERT_EQ(cls.error().code, ErrorCode::Usage);
}

TEST(CacheClass, MethodSignatureMismatchSurfacesAtBuild) {
  CacheClassBuilder builder("T");
  builder.method("x", {"a", "b"}, [](const CacheHost &, Value a) { return a; });
  auto cls = std::move(builder).build();
  ASSERT_FALSE(cls.has_value());
  ASSERT_EQ(cls.error().code, ErrorCode::Usage);
}

TEST(CacheClass, PrivateNameIsScopedToDeclaringClass) {
  int ncalls = 0;
  std::shared_ptr<const CacheClass> cls;
  CacheClassBuilder builder("T");
  builder
      .property("__x",
                [&](const CacheHost &) {
                  ++ncalls;
                  return 1;
                })
      .property("y", [&cls](const CacheHost &self) { return cls->get(self, "__x"); })
      .cache({"__x"});
  cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(ncalls, 0);
  ASSERT_EQ(*t.get("y"), Value(1));
  ASSERT_EQ(ncalls, 1);
  ASSERT_EQ(*t.get("y"), Value(1));
  ASSERT_EQ(ncalls, 1);
}

TEST(CacheClass, PrivateNameIsHiddenFromSubclass) {
  CacheClassBuilder base_builder("T");
  base_builder.property("__x", [](const CacheHost &) { return 1; }).cache({"__x"});
  auto base = build(base_builder);

  CacheClassBuilder derived_builder("U");
  derived_builder.extends(base).property("__x", [](const CacheHost &) { return 2; }).cache({"__x"});
  auto derived = build(derived_builder);
  ASSERT_EQ(derived->slot_count(), 2u);

  CacheClassBuilder plain_builder("V");
  plain_builder.extends(base);
  auto plain = build(plain_builder);

  CacheHost u(derived);
  ASSERT_EQ(*derived->get(u, "__x"), Value(2));
  ASSERT_EQ(*base->get(u, "__x"), Value(1));
  ASSERT_EQ(*derived->get(u, "__x"), Value(2));

  CacheHost v(plain);
  auto hidden = v.get("__x");
  ASSERT_FALSE(hidden.has_value());
  ASSERT_EQ(hidden.error().code, ErrorCode::NotFound);
}

TEST(CacheClass, UnknownAttributeIsNotFound) {
  CacheClassBuilder builder("T");
  auto cls = build(builder);
  CacheHost t(cls);
  ASSERT_EQ(t.get("nope").error().code, ErrorCode::NotFound);
  ASSERT_EQ(t.call_with("nope").error().code, ErrorCode::NotFound);
}

TEST(CacheClass, AccessorKindMismatch) {
  CacheClassBuilder builder("T");
  builder.property("p", [](const CacheHost &) { return 1; });
  builder.method("m", std::vector<std::string>{}, [](const CacheHost &) { return 2; });
  auto cls = build(builder);

  CacheHost t(cls);
  ASSERT_EQ(t.get("m").error().code, ErrorCode::Usage);
  ASSERT_EQ(t.call_with("p").error().code, ErrorCode::Usage);
}

TEST(CacheClass, ClassAccessRequiresOwnInstance) {
  CacheClassBuilder t_builder("T");
  t_builder.property("x", [](const CacheHost &) { return 1; })
      .method("m", std::vector<std::string>{"a"}, [](const CacheHost &, Value a) { return a; })
      .cache({"x", "m"});
  auto t_cls = build(t_builder);

  CacheClassBuilder other_builder("Other");
  auto other_cls = build(other_builder);

  CacheClassBuilder derived_builder("U");
  derived_builder.extends(t_cls).property("y", [](const CacheHost &) { return 2; }).cache({"y"});
  auto derived_cls = build(derived_builder);

  CacheHost other(other_cls);
  ASSERT_EQ(other.slots().size(), 0u);
  ASSERT_EQ(t_cls->get(other, "x").error().code, ErrorCode::Usage);
  ASSERT_EQ(t_cls->call(other, "m", CallArgs{{1}, {}}).error().code, ErrorCode::Usage);
  ASSERT_EQ(t_cls->set(other, "x", Value(3)).error().code, ErrorCode::Usage);
  ASSERT_EQ(t_cls->del(other, "x").error().code, ErrorCode::Usage);

  CacheHost base_instance(t_cls);
  ASSERT_EQ(derived_cls->get(base_instance, "y").error().code, ErrorCode::Usage);

  CacheHost derived_instance(derived_cls);
  ASSERT_EQ(*t_cls->get(derived_instance, "x"), Value(1));
  ASSERT_EQ(*derived_cls->get(derived_instance, "y"), Value(2));
}
