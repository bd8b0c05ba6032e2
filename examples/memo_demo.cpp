#include <cstdint>
#include <format>
#include <iostream>
#include <memory>
#include <optional>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "core/cache_class.hpp"
#include "core/frozen_map.hpp"

DEFINE_int32(repeat, 3, "How many times each memoized attribute is requested");

namespace {

using mk::core::CacheClassBuilder;
using mk::core::CacheHost;
using mk::core::Expected;
using mk::core::FrozenMap;

// Cantilever beam with a point load at the free end.
struct Beam : CacheHost {
  Beam(std::shared_ptr<const mk::core::CacheClass> cls, FrozenMap params)
      : CacheHost(std::move(cls)), params(std::move(params)) {}

  auto param(const char *name) const -> double { return params.find(mk::core::Value(name))->as<double>(); }

  FrozenMap params;
  mutable int evaluations = 0;
};

auto make_beam_class() -> Expected<std::shared_ptr<const mk::core::CacheClass>> {
  CacheClassBuilder builder("Beam");
  builder
      .property<Beam>("stiffness",
                      [](const Beam &beam) {
                        ++beam.evaluations;
                        const double length = beam.param("length");
                        return 3.0 * beam.param("modulus") * beam.param("inertia") /
                               (length * length * length);
                      })
      .method<Beam>("deflection", std::vector<std::string>{"load", "position"},
                    [](const Beam &beam, double load, std::optional<double> position) -> Expected<double> {
                      ++beam.evaluations;
                      const double length = beam.param("length");
                      const double x = position.value_or(length);
                      if (x < 0.0 || x > length) {
                        return tl::unexpected(mk::core::make_error(
                            mk::core::ErrorCode::Validation,
                            std::format("position {} outside beam of length {}", x, length)));
                      }
                      const double ei = beam.param("modulus") * beam.param("inertia");
                      return load * x * x * (3.0 * length - x) / (6.0 * ei);
                    })
      .cache({"stiffness", "deflection"});
  return std::move(builder).build();
}

}  // namespace

int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  mk::log::init();

  auto cls = make_beam_class();
  if (!cls) {
    std::cerr << "Class error: " << cls.error().message << "\n";
    return 1;
  }

  auto params = mk::core::make_frozen_map({{"length", 2.0}, {"modulus", 210e9}, {"inertia", 8.0e-6}});
  if (!params) {
    std::cerr << "Params error: " << params.error().message << "\n";
    return 1;
  }
  Beam beam(*cls, std::move(*params));

  for (int i = 0; i < FLAGS_repeat; ++i) {
    auto stiffness = beam.get("stiffness");
    auto tip = beam.call_with("deflection", 1000);
    auto mid = beam.call(
        "deflection",
        mk::core::CallArgs{{mk::core::Value("1000")}, {{"position", mk::core::Value(1.0)}}});
    if (!stiffness || !tip || !mid) {
      std::cerr << "Evaluation failed\n";
      return 1;
    }
    std::cout << std::format("stiffness={} tip={} mid={}\n", stiffness->repr(), tip->repr(), mid->repr());
  }

  auto outside = beam.call_with("deflection", 1000, 5.0);
  if (!outside) {
    std::cout << "rejected: " << outside.error().message << "\n";
  }

  mk::log::info("memo_demo_done", {{"evaluations", std::to_string(beam.evaluations)},
                                   {"repeat", std::to_string(FLAGS_repeat)}});
  std::cout << "bodies evaluated " << beam.evaluations << " times\n";
  mk::log::shutdown();
  return 0;
}
