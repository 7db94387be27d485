#include <gtest/gtest.h>
#include "aed/model/model.hpp"
#include "test_utils_model.hpp"

using namespace aed::model;
using aed::util::ErrorCode;
namespace fs = std::filesystem;

namespace {

void seed(const fs::path& dir) {
  fs::create_directories(dir);
  testmodel::write_text(dir / "yamnet.onnx", "model-bytes");
  testmodel::write_text(dir / "yamnet_class_map.csv", testmodel::class_map_csv({"a"}));
}

} // namespace

TEST(Cache, MissingDirectoryIsNotFound) {
  testio::TempDir tmp("cache");
  auto v = validate_cache(tmp.path() / "absent", {});
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), ErrorCode::NotFound);
}

TEST(Cache, NoManifestIsCorrupt) {
  testio::TempDir tmp("cache");
  seed(tmp.path());
  auto v = validate_cache(tmp.path(), {});
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), ErrorCode::CacheCorrupt);
}

TEST(Cache, ManifestMakesCacheComplete) {
  testio::TempDir tmp("cache");
  seed(tmp.path());
  ASSERT_TRUE(write_manifest(tmp.path(), {}).has_value());
  EXPECT_TRUE(validate_cache(tmp.path(), {}).has_value());
  EXPECT_FALSE(fs::exists(tmp.path() / "MANIFEST.tmp"));
}

TEST(Cache, TruncatedArtifactIsCorrupt) {
  testio::TempDir tmp("cache");
  seed(tmp.path());
  ASSERT_TRUE(write_manifest(tmp.path(), {}).has_value());
  testmodel::write_text(tmp.path() / "yamnet.onnx", "model");
  auto v = validate_cache(tmp.path(), {});
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), ErrorCode::CacheCorrupt);
}

TEST(Cache, DeletedArtifactIsCorrupt) {
  testio::TempDir tmp("cache");
  seed(tmp.path());
  ASSERT_TRUE(write_manifest(tmp.path(), {}).has_value());
  fs::remove(tmp.path() / "yamnet_class_map.csv");
  EXPECT_EQ(validate_cache(tmp.path(), {}).error(), ErrorCode::CacheCorrupt);
}

TEST(Cache, MalformedManifestIsCorrupt) {
  testio::TempDir tmp("cache");
  seed(tmp.path());
  testmodel::write_text(tmp.path() / "MANIFEST", "yamnet.onnx eleven\n");
  EXPECT_EQ(validate_cache(tmp.path(), {}).error(), ErrorCode::CacheCorrupt);
  // Lists only one artifact.
  testmodel::write_text(tmp.path() / "MANIFEST", "yamnet.onnx 11\n");
  EXPECT_EQ(validate_cache(tmp.path(), {}).error(), ErrorCode::CacheCorrupt);
}

TEST(Cache, WriteManifestNeedsArtifacts) {
  testio::TempDir tmp("cache");
  auto m = write_manifest(tmp.path(), {});
  ASSERT_FALSE(m.has_value());
  EXPECT_EQ(m.error(), ErrorCode::NotFound);
}

TEST(Cache, RemoveCache) {
  testio::TempDir tmp("cache");
  const auto dir = tmp.path() / "c";
  seed(dir);
  ASSERT_TRUE(remove_cache(dir).has_value());
  EXPECT_FALSE(fs::exists(dir));
  EXPECT_TRUE(remove_cache(dir).has_value());
}

TEST(MirrorSource, PopulatesCompleteCache) {
  testmodel::ModelFixture fx;
  auto src = make_mirror_model_source(fx.mirror);
  ASSERT_TRUE(src->fetch_into(fx.cache, {}).has_value());
  EXPECT_TRUE(validate_cache(fx.cache, {}).has_value());
  // No staging directory left behind.
  for (const auto& e : fs::directory_iterator(fx.cache.parent_path()))
    EXPECT_EQ(e.path().filename(), "yamnet");
}

TEST(MirrorSource, UnreachableMirror) {
  testmodel::ModelFixture fx;
  auto src = make_mirror_model_source(fx.root.path() / "nowhere");
  auto r = src->fetch_into(fx.cache, {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ErrorCode::Unavailable);
  EXPECT_FALSE(fs::exists(fx.cache));
}

TEST(MirrorSource, IncompleteMirrorLeavesNoCache) {
  testmodel::ModelFixture fx;
  fs::remove(fx.mirror / "yamnet_class_map.csv");
  auto src = make_mirror_model_source(fx.mirror);
  auto r = src->fetch_into(fx.cache, {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ErrorCode::Unavailable);
  EXPECT_FALSE(fs::exists(fx.cache));
}
