#include "core/canonical_hash.hpp"
#include "core/frozen_map.hpp"
#include <gtest/gtest.h>

#include <map>

using namespace mk::core;

namespace {

auto spam_eggs() -> FrozenMap {
  auto map = make_frozen_map({{"spam", 1}, {"eggs", 2.3}});
  EXPECT_TRUE(map.has_value());
  return map ? *map : FrozenMap{};
}

auto spam_eggs_dict() -> Dict { return Dict{{"spam", 1}, {"eggs", 2.3}}; }

}  // namespace

TEST(FrozenMap, ConstructFromEveryPairSource) {
  const Dict src = spam_eggs_dict();
  const std::vector<Value> sources{
      Value(src),
      Value(Tuple{Tuple{"spam", 1}, Tuple{"eggs", 2.3}}),
      Value(List{List{"spam", 1}, Tuple{"eggs", 2.3}}),
      Value(spam_eggs()),
  };
  for (const auto &source : sources) {
    auto frozen = make_frozen_map(source);
    ASSERT_TRUE(frozen.has_value()) << source.repr();
    ASSERT_EQ(frozen->copy(), src) << source.repr();
  }
}

TEST(FrozenMap, ConstructFromStdMap) {
  const std::map<std::string, double> src{{"a", 1.0}, {"b", 2.0}};
  auto frozen = make_frozen_map_from(src);
  ASSERT_TRUE(frozen.has_value());
  ASSERT_EQ(frozen->size(), 2u);
  ASSERT_EQ(frozen->at(Value("b"))->as<double>(), 2.0);
}

TEST(FrozenMap, BuilderKeepsLastValueForRepeatedKey) {
  FrozenMapBuilder builder;
  builder.insert("k", 1).insert("k", 2);
  auto frozen = std::move(builder).build();
  ASSERT_TRUE(frozen.has_value());
  ASSERT_EQ(frozen->size(), 1u);
  ASSERT_EQ(*frozen->at(Value("k")), Value(2));
}

TEST(FrozenMap, ConstructorRejectsNonPairs) {
  auto frozen = make_frozen_map(Value(List{"spam", "eggs", 1}));
  ASSERT_FALSE(frozen.has_value());
  ASSERT_EQ(frozen.error().code, ErrorCode::Validation);
}

TEST(FrozenMap, UnhashableKeyFails) {
  auto frozen = make_frozen_map({{List{1}, 1}});
  ASSERT_FALSE(frozen.has_value());
  ASSERT_EQ(frozen.error().code, ErrorCode::Unhashable);
}

TEST(FrozenMap, TypedFormCoercesKeysAndValues) {
  auto type = FrozenMapType::parametrize({Kind::Str, Kind::Float});
  ASSERT_TRUE(type.has_value());
  ASSERT_EQ(type->name(), "frozenmap[str, float]");

  auto frozen = (*type)(Value(Dict{{"1", 2}, {"spam", 2.3}}));
  ASSERT_TRUE(frozen.has_value());
  ASSERT_EQ(frozen->copy(), (Dict{{"1", 2.0}, {"spam", 2.3}}));
  ASSERT_EQ(frozen->at(Value("1"))->kind(), Kind::Float);
}

TEST(FrozenMap, TypedFormRejectsWrongKeyKind) {
  auto type = FrozenMapType::parametrize({Kind::Str, Kind::Float});
  ASSERT_TRUE(type.has_value());
  auto frozen = (*type)(Value(Dict{{1, 2}}));
  ASSERT_FALSE(frozen.has_value());
  ASSERT_EQ(frozen.error().code, ErrorCode::Validation);
}

TEST(FrozenMap, TypedFormWithLenientCoercers) {
  auto type = FrozenMapType::parametrize(as_str(), as_float());
  auto frozen = type(Value(Dict{{1, 2}, {"spam", "2.3"}}));
  ASSERT_TRUE(frozen.has_value());
  ASSERT_EQ(frozen->copy(), (Dict{{"1", 2.0}, {"spam", 2.3}}));
}

TEST(FrozenMap, TypedFormNeedsTwoParameters) {
  auto type = FrozenMapType::parametrize({Kind::Str, Kind::Float, Kind::Bool});
  ASSERT_FALSE(type.has_value());
  ASSERT_EQ(type.error().code, ErrorCode::Usage);
}

TEST(FrozenMap, TypedFormRejectsNonMapping) {
  auto type = FrozenMapType::parametrize({Kind::Str, Kind::Float});
  ASSERT_TRUE(type.has_value());
  auto frozen = (*type)(Value(1));
  ASSERT_FALSE(frozen.has_value());
  ASSERT_EQ(frozen.error().code, ErrorCode::Validation);
}

TEST(FrozenMap, MutationIsRejected) {
  const auto frozen = spam_eggs();
  auto set = frozen.set_item(Value("eggs"), Value(3));
  ASSERT_FALSE(set.has_value());
  ASSERT_EQ(set.error().code, ErrorCode::IllegalMutation);

  auto del = frozen.del_item(Value("eggs"));
  ASSERT_FALSE(del.has_value());
  ASSERT_EQ(del.error().code, ErrorCode::IllegalMutation);
  ASSERT_EQ(frozen.copy(), spam_eggs_dict());
}

TEST(FrozenMap, Lookup) {
  const auto frozen = spam_eggs();
  ASSERT_EQ(*frozen.at(Value("spam")), Value(1));

  auto missing = frozen.at(Value("foo"));
  ASSERT_FALSE(missing.has_value());
  ASSERT_EQ(missing.error().code, ErrorCode::NotFound);
  ASSERT_FALSE(frozen.find(Value("foo")).has_value());
  ASSERT_EQ(*frozen.find(Value("eggs")), Value(2.3));

  ASSERT_TRUE(frozen.contains(Value("spam")));
  ASSERT_FALSE(frozen.contains(Value("foo")));
  ASSERT_FALSE(frozen.contains(Value(List{})));
}

TEST(FrozenMap, IterationAndSize) {
  const auto frozen = spam_eggs();
  ASSERT_EQ(frozen.size(), 2u);
  auto keys = FrozenSet::create(frozen.keys());
  auto expected = FrozenSet::create({Value("spam"), Value("eggs")});
  ASSERT_TRUE(keys.has_value());
  ASSERT_TRUE(expected.has_value());
  ASSERT_EQ(*keys, *expected);

  std::size_t visited = 0;
  for (const auto &entry : frozen.entries()) {
    ASSERT_TRUE(entry.key.is<std::string>());
    ++visited;
  }
  ASSERT_EQ(visited, 2u);
}

TEST(FrozenMap, DigestIsStable) {
  ASSERT_EQ(*canonical_hash(Value(spam_eggs())), *canonical_hash(Value(spam_eggs())));
}

TEST(FrozenMap, CopyIsIndependentDict) {
  auto copy = spam_eggs().copy();
  ASSERT_EQ(copy, spam_eggs_dict());
  copy.insert_or_assign(Value("foo"), Value(3));
  ASSERT_EQ(copy.size(), 3u);
  ASSERT_EQ(spam_eggs().size(), 2u);
}

TEST(FrozenMap, EqualitySameInstance) {
  const auto a = spam_eggs();
  ASSERT_TRUE(a == a);
}

TEST(FrozenMap, EqualityAcrossInstancesDeduplicates) {
  const auto a = spam_eggs();
  const auto b = spam_eggs();
  ASSERT_FALSE(a.shares_store_with(b));
  ASSERT_TRUE(a == b);
  ASSERT_TRUE(a.shares_store_with(b));
  ASSERT_TRUE(a == b);
  ASSERT_EQ(a.copy(), spam_eggs_dict());
}

TEST(FrozenMap, Inequality) {
  auto smaller = make_frozen_map({{"spam", 1}});
  ASSERT_TRUE(smaller.has_value());
  ASSERT_FALSE(spam_eggs() == *smaller);
  ASSERT_NE(Value(spam_eggs()), Value(spam_eggs_dict()));
}

TEST(FrozenMap, KindExactValues) {
  auto ints = make_frozen_map({{"a", 1}});
  auto floats = make_frozen_map({{"a", 1.0}});
  ASSERT_TRUE(ints.has_value());
  ASSERT_TRUE(floats.has_value());
  ASSERT_FALSE(*ints == *floats);
}

TEST(FrozenMap, ViewsOutliveDeduplication) {
  auto a = spam_eggs();
  const auto b = spam_eggs();
  const auto view = a.entries();
  const auto *spam = view.find(Value("spam"));
  const auto *first = view.begin();
  ASSERT_NE(spam, nullptr);

  ASSERT_TRUE(a == b);
  ASSERT_TRUE(a.shares_store_with(b));

  ASSERT_EQ(*spam, Value(1));
  ASSERT_EQ(first->key.kind(), Kind::Str);
  ASSERT_EQ(view.size(), 2u);
  ASSERT_EQ(spam->repr(), "1");
}

TEST(FrozenMap, FoundValueIsIndependentOfStore) {
  auto a = spam_eggs();
  auto found = a.find(Value("spam"));
  ASSERT_TRUE(a == spam_eggs());
  a = FrozenMap();
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, Value(1));
}

TEST(FrozenMap, DigestStableAcrossDeduplication) {
  auto a = spam_eggs();
  const auto before = canonical_hash(Value(a));
  ASSERT_TRUE(a == spam_eggs());
  ASSERT_EQ(*canonical_hash(Value(a)), *before);
  ASSERT_EQ(Value(a).repr(), Value(spam_eggs()).repr());
}

TEST(Dict, IndexedLookupKeepsInsertionOrder) {
  Dict dict;
  for (int i = 0; i < 1000; ++i) {
    dict.insert_or_assign(Value(Tuple{i, "k"}), Value(i));
  }
  dict.insert_or_assign(Value(Tuple{10, "k"}), Value("ten"));
  ASSERT_EQ(dict.size(), 1000u);
  ASSERT_EQ(*dict.find(Value(Tuple{10, "k"})), Value("ten"));
  ASSERT_EQ(*dict.find(Value(Tuple{999, "k"})), Value(999));
  ASSERT_EQ(dict.find(Value(Tuple{10.0, "k"})), nullptr);
  ASSERT_EQ(dict.entries()[10].key, Value(Tuple{10, "k"}));

  ASSERT_TRUE(dict.erase(Value(Tuple{0, "k"})));
  ASSERT_FALSE(dict.erase(Value(Tuple{0, "k"})));
  ASSERT_EQ(dict.entries().front().key, Value(Tuple{1, "k"}));
  ASSERT_EQ(*dict.find(Value(Tuple{500, "k"})), Value(500));
}

TEST(Dict, UnhashableKeysAreScanned) {
  Dict dict;
  dict.insert_or_assign(Value(List{1}), Value("a"));
  dict.insert_or_assign(Value("h"), Value("b"));
  dict.insert_or_assign(Value(List{1}), Value("c"));
  ASSERT_EQ(dict.size(), 2u);
  ASSERT_EQ(*dict.find(Value(List{1})), Value("c"));
  ASSERT_TRUE(dict.erase(Value(List{1})));
  ASSERT_EQ(*dict.find(Value("h")), Value("b"));
}

TEST(Dict, LargeFrozenMapCopy) {
  FrozenMapBuilder builder(5000);
  for (int i = 0; i < 5000; ++i) {
    builder.insert(Value(i), Value(i * 2));
  }
  auto frozen = std::move(builder).build();
  ASSERT_TRUE(frozen.has_value());
  auto copy = frozen->copy();
  ASSERT_EQ(copy.size(), 5000u);
  ASSERT_EQ(*copy.find(Value(4321)), Value(8642));
}
