#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>

namespace arbor::vdom {

inline const std::shared_ptr<spdlog::logger> &logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("arbor")) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt("arbor");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

inline std::optional<spdlog::level::level_enum>
parse_log_level(std::string_view name) {
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "info") {
    return spdlog::level::info;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "critical") {
    return spdlog::level::critical;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

inline bool set_log_level(std::string_view name) {
  const auto level = parse_log_level(name);
  if (!level) {
    return false;
  }
  logger()->set_level(*level);
  return true;
}

} // namespace arbor::vdom
