#ifndef SAFEBOX_LOG_HPP
#define SAFEBOX_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace safebox {

inline constexpr const char *logger_name = "safebox";

// Library logger. Reuses a logger the application registered under
// "safebox"; otherwise creates a colored stderr logger at
// default_log_level() on first call.
std::shared_ptr<spdlog::logger> logger();

} // namespace safebox

#endif // SAFEBOX_LOG_HPP
