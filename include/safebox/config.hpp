#ifndef SAFEBOX_CONFIG_HPP
#define SAFEBOX_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace safebox {

// Environment variable names read by the library.
inline constexpr const char *log_level_env = "SAFEBOX_LOG_LEVEL";
inline constexpr const char *queue_workers_env = "SAFEBOX_QUEUE_WORKERS";

// Runtime options for a dispatch queue, and for containers backed by one.
struct queue_options {
  std::string label;
  // 0 selects default_worker_count(). Ignored by serial queues.
  std::size_t worker_count = 0;
};

// Worker count used by concurrent queues that do not ask for one:
// SAFEBOX_QUEUE_WORKERS when it holds a positive integer, otherwise the
// hardware concurrency, never less than 2.
std::size_t default_worker_count();

// Level parsed from SAFEBOX_LOG_LEVEL, or warn when unset or unrecognised.
spdlog::level::level_enum default_log_level();

// Parsers shared by the functions above; empty on invalid input.
std::optional<std::size_t> parse_worker_count(const std::string &text);
std::optional<spdlog::level::level_enum> parse_log_level(const std::string &text);

} // namespace safebox

#endif // SAFEBOX_CONFIG_HPP
