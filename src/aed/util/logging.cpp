#include "aed/util/logging.hpp"

namespace aed {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

} // namespace

void set_log_verbosity(LogVerbosity level) noexcept {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() noexcept {
  return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

std::optional<LogVerbosity> parse_log_verbosity(std::string_view text) noexcept {
  if (text == "error") return LogVerbosity::Error;
  if (text == "warn" || text == "warning") return LogVerbosity::Warn;
  if (text == "info") return LogVerbosity::Info;
  if (text == "debug") return LogVerbosity::Debug;
  return std::nullopt;
}

} // namespace aed
