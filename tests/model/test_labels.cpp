#include <gtest/gtest.h>
#include "aed/model/labels.hpp"
#include "test_utils_model.hpp"

using aed::model::LabelSet;
using aed::util::ErrorCode;

TEST(Labels, ParsesQuotedNamesWithCommas) {
  const char* csv =
      "index,mid,display_name\n"
      "0,/m/09x0r,Speech\n"
      "1,/m/0ytgt,\"Child speech, kid speaking\"\n"
      "2,/m/01h8n0,\"Say \"\"cheese\"\"\"\r\n";
  auto ls = LabelSet::from_csv(csv);
  ASSERT_TRUE(ls.has_value());
  ASSERT_EQ(ls->size(), 3u);
  EXPECT_EQ(ls->name(0), "Speech");
  EXPECT_EQ(ls->name(1), "Child speech, kid speaking");
  EXPECT_EQ(ls->name(2), "Say \"cheese\"");
  EXPECT_EQ(ls->name(3), "");
}

TEST(Labels, CopiesShareTheNameTable) {
  auto ls = LabelSet::from_names({"a", "b"});
  LabelSet copy = ls;
  EXPECT_EQ(copy.names().get(), ls.names().get());
}

TEST(Labels, ExpectedCount) {
  auto csv = testmodel::class_map_csv(testmodel::fake_label_names());
  EXPECT_TRUE(LabelSet::from_csv(csv, 4).has_value());
  auto bad = LabelSet::from_csv(csv, aed::model::kYamnetLabelCount);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), ErrorCode::SizeMismatch);
}

TEST(Labels, RejectsMalformedMaps) {
  // No header.
  EXPECT_EQ(LabelSet::from_csv("0,/m/1,Speech\n").error(), ErrorCode::InvalidArgument);
  // Header only.
  EXPECT_EQ(LabelSet::from_csv("index,mid,display_name\n").error(), ErrorCode::InvalidArgument);
  // Index gap.
  EXPECT_EQ(LabelSet::from_csv("index,mid,display_name\n0,a,A\n2,b,B\n").error(),
            ErrorCode::InvalidArgument);
  // Unterminated quote.
  EXPECT_EQ(LabelSet::from_csv("index,mid,display_name\n0,a,\"A\n").error(),
            ErrorCode::InvalidArgument);
  // Too few fields.
  EXPECT_EQ(LabelSet::from_csv("index,mid,display_name\n0,a\n").error(), ErrorCode::InvalidArgument);
}

TEST(Labels, SkipsBlankLines) {
  auto ls = LabelSet::from_csv("index,mid,display_name\n0,a,A\n\n1,b,B\n\n");
  ASSERT_TRUE(ls.has_value());
  EXPECT_EQ(ls->size(), 2u);
}

TEST(Labels, LoadFile) {
  testio::TempFile tf("classmap", ".csv");
  const auto csv = testmodel::class_map_csv({"x", "y", "z"});
  tf.write(csv.data(), csv.size());
  auto ls = LabelSet::load_file(tf.path(), 3);
  ASSERT_TRUE(ls.has_value());
  EXPECT_EQ(ls->name(2), "z");

  auto missing = LabelSet::load_file("/nonexistent/aed/map.csv");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), ErrorCode::IOError);
}
