#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "aed/store/store.hpp"
#include "io/test_utils.hpp"

using namespace aed::store;
using aed::util::ErrorCode;
using namespace std::chrono_literals;

namespace {

void write_object(const std::filesystem::path& p, std::size_t bytes) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  std::vector<char> buf(bytes);
  for (std::size_t i = 0; i < bytes; ++i) buf[i] = static_cast<char>(i & 0xFF);
  out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
}

} // namespace

TEST(DirectorySource, FetchesNestedKey) {
  testio::TempDir root("aed_src");
  write_object(root.path() / "dev1" / "2024-05-01" / "00-00.wav", 3000);
  auto src = make_directory_audio_source(root.path());
  auto got = src->fetch("dev1/2024-05-01/00-00.wav", {});
  ASSERT_TRUE(got.has_value());
  ASSERT_EQ(got->size(), 3000u);
  EXPECT_EQ((*got)[257], std::byte{1});
}

TEST(DirectorySource, LargeObjectReadCompletely) {
  testio::TempDir root("aed_src");
  const std::size_t n = (1u << 20) * 2 + 17; // spans several read chunks
  write_object(root.path() / "big.wav", n);
  auto got = make_directory_audio_source(root.path())->fetch("big.wav", {});
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->size(), n);
}

TEST(DirectorySource, MissingKeyIsNotFound) {
  testio::TempDir root("aed_src");
  auto src = make_directory_audio_source(root.path());
  EXPECT_EQ(src->fetch("dev1/nope.wav", {}).error(), ErrorCode::NotFound);
}

TEST(DirectorySource, MissingRootIsUnavailable) {
  auto src = make_directory_audio_source(testio::unique_temp_path("aed_gone"));
  EXPECT_EQ(src->fetch("a.wav", {}).error(), ErrorCode::Unavailable);
}

TEST(DirectorySource, RejectsEscapingKeys) {
  testio::TempDir root("aed_src");
  auto src = make_directory_audio_source(root.path());
  EXPECT_EQ(src->fetch("../etc/passwd", {}).error(), ErrorCode::InvalidArgument);
  EXPECT_EQ(src->fetch("a/../../b.wav", {}).error(), ErrorCode::InvalidArgument);
  EXPECT_EQ(src->fetch("/etc/passwd", {}).error(), ErrorCode::InvalidArgument);
  EXPECT_EQ(src->fetch("", {}).error(), ErrorCode::InvalidArgument);
}

TEST(DirectorySource, DirectoryKeyIsIOError) {
  testio::TempDir root("aed_src");
  std::filesystem::create_directories(root.path() / "dev1");
  EXPECT_EQ(make_directory_audio_source(root.path())->fetch("dev1", {}).error(), ErrorCode::IOError);
}

TEST(DirectorySource, ZeroTimeoutTimesOut) {
  testio::TempDir root("aed_src");
  write_object(root.path() / "a.wav", 64);
  FetchOptions opts;
  opts.timeout = 0ms;
  EXPECT_EQ(make_directory_audio_source(root.path())->fetch("a.wav", opts).error(), ErrorCode::Timeout);
}
