#include "common/logging/log.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_to_stderr);

namespace {

auto create_file_sink(const std::string &file_path, std::size_t max_size, int max_files)
    -> std::shared_ptr<spdlog::sinks::sink> {
  max_files = std::max(max_files, 1);
  max_size = std::max<std::size_t>(max_size, 1024);
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, max_size,
                                                                static_cast<std::size_t>(max_files));
}

auto parse_log_level(const std::string &level) -> spdlog::level::level_enum {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

namespace mk::log {

namespace {
std::mutex g_mutex;
std::shared_ptr<spdlog::async_logger> g_logger;
}  // namespace

void init() {
  std::lock_guard lock(g_mutex);
  if (g_logger) {
    return;
  }

  const auto level = parse_log_level(FLAGS_log_level);
  spdlog::init_thread_pool(8192, 1);

  std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
  sinks.push_back(create_file_sink(FLAGS_log_file, static_cast<std::size_t>(FLAGS_log_max_size),
                                   FLAGS_log_max_files));
  if (FLAGS_log_to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  for (auto &sink : sinks) {
    sink->set_level(level);
  }

  g_logger = std::make_shared<spdlog::async_logger>("memokit", sinks.begin(), sinks.end(),
                                                    spdlog::thread_pool(),
                                                    spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(g_logger);
  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  spdlog::info("Logger initialized: file={}, level={}", FLAGS_log_file, FLAGS_log_level);
}

void shutdown() {
  std::lock_guard lock(g_mutex);
  if (g_logger) {
    g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
  }
}

void info(std::string_view event, const std::unordered_map<std::string, std::string> &fields) {
  std::vector<std::pair<std::string_view, std::string_view>> sorted(fields.begin(), fields.end());
  std::sort(sorted.begin(), sorted.end());
  std::string msg{event};
  for (const auto &[key, value] : sorted) {
    msg += " ";
    msg += key;
    msg += "=";
    msg += value;
  }
  spdlog::info(msg);
}

auto level_name() -> std::string_view {
  const auto name = spdlog::level::to_string_view(spdlog::get_level());
  return {name.data(), name.size()};
}

}  // namespace mk::log
