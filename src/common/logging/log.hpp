#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mk::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Installs the async rotating-file logger described by the --log_* flags.
/// Safe to call more than once.
void init();

void shutdown();

/// Emits "event key=value ..." at info level, keys in sorted order.
void info(std::string_view event, const std::unordered_map<std::string, std::string> &fields);

auto level_name() -> std::string_view;

}  // namespace mk::log
