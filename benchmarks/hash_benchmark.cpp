#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include "core/cache_class.hpp"
#include "core/canonical_hash.hpp"
#include "core/frozen_map.hpp"

namespace {

using namespace mk::core;

auto make_tuple_value(int width) -> Value {
  std::vector<Value> items;
  items.reserve(static_cast<std::size_t>(width));
  for (int i = 0; i < width; ++i) {
    items.emplace_back(Tuple{i, static_cast<double>(i) / 3.0, "item" + std::to_string(i)});
  }
  return Value(Tuple(std::move(items)));
}

auto make_map_value(int width) -> Value {
  FrozenMapBuilder builder;
  builder.reserve(static_cast<std::size_t>(width));
  for (int i = 0; i < width; ++i) {
    builder.insert(Value("key" + std::to_string(i)), Value(Tuple{i, i * 2}));
  }
  auto map = std::move(builder).build();
  return map ? Value(std::move(*map)) : Value();
}

void BM_HashTuple(benchmark::State &state) {
  const auto value = make_tuple_value(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    auto digest = canonical_hash(value);
    benchmark::DoNotOptimize(digest);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void BM_HashFrozenMap(benchmark::State &state) {
  const auto value = make_map_value(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    auto digest = canonical_hash(value);
    benchmark::DoNotOptimize(digest);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void BM_HashBigInt(benchmark::State &state) {
  BigInt number = 1;
  number <<= static_cast<mp_bitcnt_t>(state.range(0));
  number -= 1;
  const Value value(number);
  for (auto _ : state) {
    auto digest = canonical_hash(value);
    benchmark::DoNotOptimize(digest);
  }
}

void BM_BuildFrozenMap(benchmark::State &state) {
  for (auto _ : state) {
    auto value = make_map_value(static_cast<int>(state.range(0)));
    benchmark::DoNotOptimize(value);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void BM_CachedMethodHit(benchmark::State &state) {
  CacheClassBuilder builder("Bench");
  builder
      .method("scale", std::vector<std::string>{"x", "factor"},
              [](const CacheHost &, double x, double factor) { return x * factor; })
      .cache({"scale"});
  auto cls = std::move(builder).build();
  if (!cls) {
    state.SkipWithError(cls.error().message.c_str());
    return;
  }
  CacheHost host(*cls);
  for (auto _ : state) {
    auto result = host.call_with("scale", 2.5, 4);
    benchmark::DoNotOptimize(result);
  }
}

}  // namespace

BENCHMARK(BM_HashTuple)->Arg(8)->Arg(64)->Arg(512);
BENCHMARK(BM_HashFrozenMap)->Arg(8)->Arg(64)->Arg(512);
BENCHMARK(BM_HashBigInt)->Arg(64)->Arg(1024)->Arg(16384);
BENCHMARK(BM_BuildFrozenMap)->Arg(8)->Arg(64)->Arg(512);
BENCHMARK(BM_CachedMethodHit);

BENCHMARK_MAIN();
