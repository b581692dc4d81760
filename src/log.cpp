#include "safebox/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "safebox/config.hpp"

namespace safebox {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
  if (auto existing = spdlog::get(logger_name)) {
    return existing;
  }

  try {
    auto created = spdlog::stderr_color_mt(logger_name);
    created->set_level(default_log_level());
    return created;
  } catch (const spdlog::spdlog_ex &) {
    // Lost a registration race with the application; use its logger.
    return spdlog::get(logger_name);
  }
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

} // namespace safebox
