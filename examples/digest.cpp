#include <exception>
#include <format>
#include <iostream>
#include <string>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "core/canonical_hash.hpp"
#include "core/value_json.hpp"

DEFINE_bool(plain, false, "Read plain JSON (objects become frozen maps, arrays become tuples)");
DEFINE_bool(echo, false, "Print the decoded value's repr next to its digest");

namespace {

auto digest_line(const std::string &line) -> int {
  mk::core::Json json;
  try {
    json = mk::core::Json::parse(line);
  } catch (const std::exception &ex) {
    std::cerr << "Failed to parse JSON: " << ex.what() << "\n";
    return 1;
  }

  auto value = FLAGS_plain ? mk::core::from_plain_json(json) : mk::core::decode_json(json);
  if (!value) {
    std::cerr << "Decode error: " << value.error().message << "\n";
    return 1;
  }

  auto digest = mk::core::canonical_hash(*value);
  if (!digest) {
    std::cerr << "Hash error: " << digest.error().message << "\n";
    return 1;
  }

  if (FLAGS_echo) {
    std::cout << std::format("{}  {}\n", digest->hex(), value->repr());
  } else {
    std::cout << digest->hex() << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage("memokit_digest [--plain] [json ...]\n"
                          "Prints the canonical digest of each JSON value given as an argument, "
                          "or of each line on stdin when no arguments are given.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  mk::log::init();

  int status = 0;
  if (argc > 1) {
    for (int i = 1; i < argc; ++i) {
      status |= digest_line(argv[i]);
    }
  } else {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }
      status |= digest_line(line);
    }
  }

  mk::log::info("digest_done", {{"status", std::to_string(status)}});
  mk::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
