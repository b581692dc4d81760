#include "safebox/config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>
#include <thread>

namespace safebox {

namespace {

constexpr std::size_t min_concurrent_workers = 2;

std::optional<std::string> read_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace

std::optional<std::size_t> parse_worker_count(const std::string &text) {
  std::size_t count = 0;
  const char *first = text.data();
  const char *last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, count);
  if (ec != std::errc() || ptr != last || count == 0) {
    return std::nullopt;
  }
  return count;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string &text) {
  // from_str maps anything it does not know to off
  auto level = spdlog::level::from_str(text);
  if (level == spdlog::level::off && text != "off") {
    return std::nullopt;
  }
  return level;
}

std::size_t default_worker_count() {
  if (auto env = read_env(queue_workers_env)) {
    if (auto count = parse_worker_count(*env)) {
      return *count;
    }
  }

  std::size_t processor_count = std::thread::hardware_concurrency();
  return processor_count < min_concurrent_workers ? min_concurrent_workers
                                                  : processor_count;
}

spdlog::level::level_enum default_log_level() {
  if (auto env = read_env(log_level_env)) {
    if (auto level = parse_log_level(*env)) {
      return *level;
    }
  }
  return spdlog::level::warn;
}

} // namespace safebox
