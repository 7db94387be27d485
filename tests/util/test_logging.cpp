#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "aed/util/logging.hpp"

namespace {

/** Captures std::cerr and restores verbosity for the test's lifetime. */
class LogCapture {
public:
  LogCapture() : old_(std::cerr.rdbuf(buf_.rdbuf())), level_(aed::get_log_verbosity()) {}
  ~LogCapture() {
    std::cerr.rdbuf(old_);
    aed::set_log_verbosity(level_);
  }
  std::string text() const { return buf_.str(); }

private:
  std::ostringstream buf_;
  std::streambuf* old_;
  aed::LogVerbosity level_;
};

} // namespace

TEST(Logging, ParseLevels) {
  EXPECT_EQ(aed::parse_log_verbosity("error"), aed::LogVerbosity::Error);
  EXPECT_EQ(aed::parse_log_verbosity("warn"), aed::LogVerbosity::Warn);
  EXPECT_EQ(aed::parse_log_verbosity("warning"), aed::LogVerbosity::Warn);
  EXPECT_EQ(aed::parse_log_verbosity("info"), aed::LogVerbosity::Info);
  EXPECT_EQ(aed::parse_log_verbosity("debug"), aed::LogVerbosity::Debug);
  EXPECT_FALSE(aed::parse_log_verbosity("INFO").has_value());
  EXPECT_FALSE(aed::parse_log_verbosity("").has_value());
}

TEST(Logging, VerbosityFilters) {
  LogCapture cap;
  aed::set_log_verbosity(aed::LogVerbosity::Warn);
  AED_LOG_DEBUG("hidden debug " << 1);
  AED_LOG_INFO("hidden info");
  AED_LOG_WARN("shown warn " << 2);
  const auto out = cap.text();
  EXPECT_EQ(out.find("hidden"), std::string::npos);
  EXPECT_NE(out.find("[aed][warn] shown warn 2"), std::string::npos);
}

TEST(Logging, ErrorsCarrySourceLocation) {
  LogCapture cap;
  aed::set_log_verbosity(aed::LogVerbosity::Error);
  AED_LOG_ERROR("broken");
  const auto out = cap.text();
  EXPECT_NE(out.find("[aed][error]["), std::string::npos);
  EXPECT_NE(out.find("test_logging.cpp:"), std::string::npos);
  EXPECT_NE(out.find("] broken"), std::string::npos);
}

TEST(Logging, StreamAssemblesOneLine) {
  LogCapture cap;
  aed::set_log_verbosity(aed::LogVerbosity::Debug);
  {
    auto s = AED_LOG_DEBUG_STREAM();
    s << "frames=" << 5;
    s << " batches=" << 1;
  }
  EXPECT_NE(cap.text().find("[aed][debug] frames=5 batches=1\n"), std::string::npos);
}

TEST(Logging, DisabledStreamWritesNothing) {
  LogCapture cap;
  aed::set_log_verbosity(aed::LogVerbosity::Error);
  AED_LOG_STREAM("warn") << "quiet";
  EXPECT_TRUE(cap.text().empty());
}
