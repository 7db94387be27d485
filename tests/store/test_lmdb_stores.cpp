#include <gtest/gtest.h>
#include "aed/store/store.hpp"
#include "io/test_utils.hpp"

using namespace aed::store;
using aed::util::DetectionEvent;
using aed::util::ErrorCode;
using namespace std::chrono_literals;

namespace {

struct LmdbFixture : ::testing::Test {
  testio::TempDir dir{"aed_lmdb"};
  std::shared_ptr<LmdbEnv> env;

  void SetUp() override {
    LmdbOptions o;
    o.map_size_bytes = 16u << 20;
    o.use_nosync = true;
    auto e = open_lmdb(dir.path() / "db", o);
    ASSERT_TRUE(e.has_value());
    env = *e;
  }
};

} // namespace

TEST_F(LmdbFixture, StatusLifecycle) {
  auto s = make_lmdb_status_store(env);
  EXPECT_EQ(*s->mark_completed("dev1/2024-05-01/00-00.wav", "sed_status", 1000ms),
            StatusUpdate::NoMatchingRecord);
  EXPECT_FALSE(s->flag_value("dev1/2024-05-01/00-00.wav", "sed_status")->has_value());

  ASSERT_TRUE(s->register_unit("dev1/2024-05-01/00-00.wav").has_value());
  EXPECT_EQ(*s->mark_completed("dev1/2024-05-01/00-00.wav", "sed_status", 1000ms), StatusUpdate::Updated);
  EXPECT_EQ(s->flag_value("dev1/2024-05-01/00-00.wav", "sed_status")->value_or(""), kCompletedValue);
  EXPECT_FALSE(s->flag_value("dev1/2024-05-01/00-00.wav", "vad_status")->has_value());
}

TEST_F(LmdbFixture, FlagsSurviveReRegisterAndOtherFlags) {
  auto s = make_lmdb_status_store(env);
  ASSERT_TRUE(s->register_unit("u").has_value());
  ASSERT_TRUE(s->mark_completed("u", "vad_status", 1000ms).has_value());
  ASSERT_TRUE(s->mark_completed("u", "sed_status", 1000ms).has_value());
  ASSERT_TRUE(s->register_unit("u").has_value());
  EXPECT_TRUE(s->flag_value("u", "vad_status")->has_value());
  EXPECT_TRUE(s->flag_value("u", "sed_status")->has_value());
}

TEST_F(LmdbFixture, StatusRejectsEmptyKeys) {
  auto s = make_lmdb_status_store(env);
  EXPECT_EQ(s->register_unit("").error(), ErrorCode::InvalidArgument);
  EXPECT_EQ(s->mark_completed("u", "", 1000ms).error(), ErrorCode::InvalidArgument);
}

TEST_F(LmdbFixture, ResultsPutGet) {
  auto r = make_lmdb_result_store(env);
  EXPECT_EQ(r->get("u", "top_n").error(), ErrorCode::NotFound);

  std::vector<DetectionEvent> ev{{0, "Speech", 0.875f}, {12, "Dog, bark", 0.25f}};
  ASSERT_TRUE(r->put("u", "top_n", ev, 1000ms).has_value());
  ASSERT_TRUE(r->put("u", "t=480", {}, 1000ms).has_value());

  auto got = r->get("u", "top_n");
  ASSERT_TRUE(got.has_value());
  ASSERT_EQ(got->size(), 2u);
  EXPECT_EQ((*got)[1].label_index, 12);
  EXPECT_EQ((*got)[1].label, "Dog, bark");
  EXPECT_FLOAT_EQ((*got)[0].probability, 0.875f);
  EXPECT_TRUE(r->get("u", "t=480")->empty());
  EXPECT_EQ(r->get("u", "t=960").error(), ErrorCode::NotFound);
}

TEST_F(LmdbFixture, ResultKeysDoNotCollide) {
  auto r = make_lmdb_result_store(env);
  ASSERT_TRUE(r->put("ab", "c", {{1, "x", 0.5f}}, 1000ms).has_value());
  ASSERT_TRUE(r->put("a", "bc", {{2, "y", 0.5f}}, 1000ms).has_value());
  EXPECT_EQ(r->get("ab", "c")->at(0).label, "x");
  EXPECT_EQ(r->get("a", "bc")->at(0).label, "y");
}

TEST_F(LmdbFixture, EraseUnitRemovesOnlyThatUnit) {
  auto r = make_lmdb_result_store(env);
  ASSERT_TRUE(r->put("a", "top_n", {{1, "x", 0.5f}}, 1000ms).has_value());
  ASSERT_TRUE(r->put("a", "t=0", {{1, "x", 0.5f}}, 1000ms).has_value());
  ASSERT_TRUE(r->put("a", "t=960", {}, 1000ms).has_value());
  ASSERT_TRUE(r->put("ab", "t=0", {{2, "y", 0.5f}}, 1000ms).has_value());
  ASSERT_TRUE(r->put("0", "t=0", {}, 1000ms).has_value());

  auto n = r->erase_unit("a", 1000ms);
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(*n, 3u);
  EXPECT_EQ(r->get("a", "top_n").error(), ErrorCode::NotFound);
  EXPECT_EQ(r->get("a", "t=0").error(), ErrorCode::NotFound);
  EXPECT_EQ(r->get("a", "t=960").error(), ErrorCode::NotFound);
  EXPECT_EQ(r->get("ab", "t=0")->at(0).label, "y");
  EXPECT_TRUE(r->get("0", "t=0").has_value());

  EXPECT_EQ(*r->erase_unit("a", 1000ms), 0u);
  EXPECT_EQ(*r->erase_unit("zzz", 1000ms), 0u);
  EXPECT_EQ(r->erase_unit("", 1000ms).error(), ErrorCode::InvalidArgument);
}

TEST_F(LmdbFixture, ReopenKeepsData) {
  {
    auto s = make_lmdb_status_store(env);
    ASSERT_TRUE(s->register_unit("u").has_value());
    ASSERT_TRUE(s->mark_completed("u", "sed_status", 1000ms).has_value());
  }
  env.reset();
  auto again = open_lmdb(dir.path() / "db");
  ASSERT_TRUE(again.has_value());
  auto s = make_lmdb_status_store(*again);
  EXPECT_TRUE(s->flag_value("u", "sed_status")->has_value());
}
