#include <gtest/gtest.h>
#include "aed/infer/infer.hpp"
#include "io/test_utils.hpp"
#include "model/test_utils_model.hpp"

using namespace aed::infer;
using aed::util::ErrorCode;
using testmodel::FakeModelHandle;

namespace {

aed::util::Waveform waveform(std::vector<float> x, uint32_t sr = 16000) {
  aed::util::Waveform w;
  w.samples = kfr::univector<float>(x.begin(), x.end());
  w.sample_rate_hz = sr;
  w.original_sample_rate_hz = sr;
  return w;
}

FakeModelHandle make_handle(uint32_t max_batch = 0) {
  return FakeModelHandle(aed::model::LabelSet::from_names(testmodel::fake_label_names()), {}, 1,
                         15600, max_batch);
}

} // namespace

TEST(Engine, MatrixShapeAndStride) {
  auto h = make_handle();
  auto engine = make_default_engine();
  auto w = waveform(testio::make_sine(440.f, 16000.f, 32000, 0.2f)); // 2 s
  auto M = engine->infer(w, h);
  ASSERT_TRUE(M.has_value());
  EXPECT_EQ(M->num_frames, frame_count(32000, 7680)); // 5
  EXPECT_EQ(M->num_labels, 4);
  EXPECT_DOUBLE_EQ(M->frame_stride_s, 0.48);
  EXPECT_EQ(M->scores.size(), size_t(M->num_frames) * 4u);
  EXPECT_EQ(M->labels.get(), h.labels().names().get());
  EXPECT_EQ(aed::util::label_name(*M, 0), "Speech");
}

TEST(Engine, SixtySecondsGivesHundredTwentyFiveFrames) {
  auto h = make_handle();
  auto M = make_default_engine()->infer(waveform(std::vector<float>(960000, 0.0f)), h);
  ASSERT_TRUE(M.has_value());
  EXPECT_EQ(M->num_frames, 125u);
  // 125 frames in batches of 32.
  ASSERT_EQ(h.batches.size(), 4u);
  EXPECT_EQ(h.batches.back(), 29u);
}

TEST(Engine, HandleBatchLimitRespected) {
  auto h = make_handle(1);
  auto M = make_default_engine()->infer(waveform(std::vector<float>(16000, 0.1f)), h);
  ASSERT_TRUE(M.has_value());
  EXPECT_EQ(h.batches.size(), size_t(M->num_frames));
  for (auto b : h.batches) EXPECT_EQ(b, 1u);
}

TEST(BatchLimit, FromModelInputShape) {
  using aed::model::batch_limit_for_input_shape;
  EXPECT_EQ(batch_limit_for_input_shape(std::vector<std::int64_t>{15600}), 1u);
  EXPECT_EQ(batch_limit_for_input_shape(std::vector<std::int64_t>{-1}), 1u);
  EXPECT_EQ(batch_limit_for_input_shape(std::vector<std::int64_t>{1, 15600}), 1u);
  EXPECT_EQ(batch_limit_for_input_shape(std::vector<std::int64_t>{8, 15600}), 8u);
  EXPECT_EQ(batch_limit_for_input_shape(std::vector<std::int64_t>{-1, 15600}), 0u);
  EXPECT_EQ(batch_limit_for_input_shape(std::vector<std::int64_t>{0, 15600}), 0u);
}

TEST(Engine, FixedSingleFrameInputRunsOneFramePerPass) {
  const std::vector<std::int64_t> fixed{1, 15600};
  auto h = make_handle(aed::model::batch_limit_for_input_shape(fixed));
  auto M = make_default_engine()->infer(waveform(std::vector<float>(32000, 0.1f)), h);
  ASSERT_TRUE(M.has_value());
  EXPECT_EQ(M->num_frames, 5u);
  ASSERT_EQ(h.batches.size(), 5u);
  for (auto b : h.batches) EXPECT_EQ(b, 1u);
}

TEST(Engine, FixedBatchOfEightSplitsLongInput) {
  const std::vector<std::int64_t> fixed{8, 15600};
  auto h = make_handle(aed::model::batch_limit_for_input_shape(fixed));
  auto M = make_default_engine()->infer(waveform(std::vector<float>(960000, 0.1f)), h);
  ASSERT_TRUE(M.has_value());
  EXPECT_EQ(M->num_frames, 125u);
  ASSERT_EQ(h.batches.size(), 16u); // 15 full batches plus 5 frames
  for (auto b : h.batches) EXPECT_LE(b, 8u);
  EXPECT_EQ(h.batches.back(), 5u);
}

TEST(Engine, RowsFollowFrameContent) {
  // Loud first half, silent second half.
  std::vector<float> x(7680 * 4, 0.0f);
  for (size_t i = 0; i < 7680 * 2; ++i) x[i] = (i % 2) ? 0.5f : -0.5f;
  auto h = make_handle();
  auto M = make_default_engine()->infer(waveform(x), h);
  ASSERT_TRUE(M.has_value());
  ASSERT_EQ(M->num_frames, 4u);
  EXPECT_GT(aed::util::matrix_row(*M, 0)[0], 0.9f);      // Speech
  EXPECT_FLOAT_EQ(aed::util::matrix_row(*M, 3)[0], 0.0f);
  EXPECT_FLOAT_EQ(aed::util::matrix_row(*M, 3)[2], 1.0f); // Silence
}

TEST(Engine, BatchSizeDoesNotChangeScores) {
  auto x = testio::make_noise(16000 * 3, 0.3f);
  auto h1 = make_handle();
  auto h2 = make_handle(1);
  auto a = make_default_engine()->infer(waveform(x), h1);
  auto b = make_default_engine(FramingParams{15600, 7680, 5})->infer(waveform(x), h2);
  ASSERT_TRUE(a.has_value() && b.has_value());
  ASSERT_EQ(a->scores.size(), b->scores.size());
  for (size_t i = 0; i < a->scores.size(); ++i) ASSERT_EQ(a->scores[i], b->scores[i]);
}

TEST(Engine, RejectsBadWaveforms) {
  auto h = make_handle();
  auto engine = make_default_engine();
  EXPECT_EQ(engine->infer(waveform({}), h).error(), ErrorCode::InferenceError);
  EXPECT_EQ(engine->infer(waveform(std::vector<float>(100, 0.f), 44100), h).error(),
            ErrorCode::InferenceError);
  auto narrow = make_default_engine(FramingParams{8000, 4000, 8});
  EXPECT_EQ(narrow->infer(waveform(std::vector<float>(100, 0.f)), h).error(),
            ErrorCode::InferenceError);
}

TEST(Engine, CacheCorruptPassesThrough) {
  testio::TempDir dir("engine");
  const auto model_file = dir.path() / "yamnet.onnx";
  testmodel::write_text(model_file, "x");
  FakeModelHandle h(aed::model::LabelSet::from_names(testmodel::fake_label_names()), model_file, 1);
  auto engine = make_default_engine();
  auto w = waveform(std::vector<float>(16000, 0.1f));
  ASSERT_TRUE(engine->infer(w, h).has_value());

  std::filesystem::remove(model_file);
  auto M = engine->infer(w, h);
  ASSERT_FALSE(M.has_value());
  EXPECT_EQ(M.error(), ErrorCode::CacheCorrupt);
}
