#pragma once
#include <atomic>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace aed {

/**
 * Logging level policy.
 *  - Error: the requested operation (unit, run, load) cannot complete.
 *  - Warn: degraded behavior, retries, sink failures, soft misses.
 *  - Info: lifecycle and per-batch summaries.
 *  - Debug: per-frame and per-attempt traces.
 */
enum class LogVerbosity {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

/** Set the process-wide log verbosity. Thread-safe. */
void set_log_verbosity(LogVerbosity level) noexcept;

/** Current process-wide log verbosity. Thread-safe. */
LogVerbosity get_log_verbosity() noexcept;

/** Parse "error", "warn", "info" or "debug" (case-sensitive). */
std::optional<LogVerbosity> parse_log_verbosity(std::string_view text) noexcept;

inline constexpr LogVerbosity severity_for_tag(std::string_view tag) noexcept {
  if (tag == "error") return LogVerbosity::Error;
  if (tag == "warn") return LogVerbosity::Warn;
  if (tag == "info") return LogVerbosity::Info;
  return LogVerbosity::Debug;
}

inline bool should_log(const char* level) noexcept {
  const auto severity = severity_for_tag(level ? level : "");
  return static_cast<int>(severity) <= static_cast<int>(get_log_verbosity());
}

inline void log_impl(const char* level, const std::string& message,
                     const char* file, int line, const char* func) {
  const std::string_view label = level ? level : "";
  if (label == "error") {
    std::cerr << "[aed][" << label << "][" << file << ":" << line << " "
              << func << "] " << message << "\n";
    return;
  }
  std::cerr << "[aed][" << label << "] " << message << "\n";
}

/** Stream-style logger for messages assembled over several statements. */
class LogStream {
public:
  LogStream(const char* level, const char* file, int line, const char* func)
    : level_(level), file_(file), line_(line), func_(func),
      enabled_(should_log(level)) {}

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  template <typename T>
  LogStream& operator<<(const T& value) {
    if (enabled_) stream_ << value;
    return *this;
  }

  ~LogStream() {
    if (enabled_) log_impl(level_, stream_.str(), file_, line_, func_);
  }

private:
  const char* level_{nullptr};
  const char* file_{nullptr};
  int line_{0};
  const char* func_{nullptr};
  bool enabled_{false};
  std::ostringstream stream_;
};

} // namespace aed

#define AED_LOG(level, message)                                              \
  do {                                                                       \
    if (::aed::should_log(level)) {                                          \
      std::ostringstream _aed_log_stream;                                    \
      _aed_log_stream << message;                                            \
      ::aed::log_impl(level, _aed_log_stream.str(), __FILE__, __LINE__,     \
                      __func__);                                             \
    }                                                                        \
  } while (0)

#define AED_LOG_STREAM(level) ::aed::LogStream(level, __FILE__, __LINE__, __func__)
#define AED_LOG_DEBUG_STREAM() AED_LOG_STREAM("debug")

#define AED_LOG_ERROR(message) AED_LOG("error", message)
#define AED_LOG_WARN(message) AED_LOG("warn", message)
#define AED_LOG_INFO(message) AED_LOG("info", message)
#define AED_LOG_DEBUG(message) AED_LOG("debug", message)
