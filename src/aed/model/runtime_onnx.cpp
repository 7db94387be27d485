#include "aed/model/model.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <limits>
#include <mutex>
#include <new>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "aed/util/logging.hpp"

namespace aed::model {
using aed::util::ErrorCode;
using aed::util::Expected;
namespace fs = std::filesystem;

namespace {

// ==============================
// Session wrapper
// ==============================

class OnnxModelHandle final : public IModelHandle {
public:
  OnnxModelHandle(std::shared_ptr<Ort::Env> env,
                  std::unique_ptr<Ort::Session> session,
                  LabelSet labels,
                  fs::path model_path,
                  const OnnxOptions& opt,
                  std::uint64_t generation)
    : env_(std::move(env)), session_(std::move(session)), labels_(std::move(labels)),
      model_path_(std::move(model_path)), sample_rate_hz_(opt.sample_rate_hz),
      window_(opt.frame_window_samples), generation_(generation),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
    Ort::AllocatorWithDefaultOptions allocator;
    input_name_ = session_->GetInputNameAllocated(0, allocator).get();

    const std::size_t outputs = session_->GetOutputCount();
    output_name_ = session_->GetOutputNameAllocated(0, allocator).get();
    for (std::size_t i = 0; i < outputs; ++i) {
      std::string name = session_->GetOutputNameAllocated(i, allocator).get();
      if (name == opt.scores_output) {
        output_name_ = std::move(name);
        break;
      }
    }

    // YAMNet exports take either a single waveform [N] or a batch [B, N].
    auto shape = session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    batched_ = shape.size() >= 2;
    max_batch_ = batch_limit_for_input_shape(shape);
    if (max_batch_ != 0) {
      AED_LOG_DEBUG("model input batch fixed at " << max_batch_ << " frame(s)");
    }
  }

  [[nodiscard]] const LabelSet& labels() const noexcept override { return labels_; }
  [[nodiscard]] util::SampleRateHz sample_rate_hz() const noexcept override { return sample_rate_hz_; }
  [[nodiscard]] std::uint32_t frame_window_samples() const noexcept override { return window_; }
  [[nodiscard]] std::uint32_t max_batch_frames() const noexcept override { return max_batch_; }
  [[nodiscard]] std::uint64_t generation() const noexcept override { return generation_; }

  [[nodiscard]] Expected<kfr::univector<float>>
  classify(std::span<const float> frames, std::uint32_t num_frames) const override {
    if (num_frames == 0 || frames.size() != std::size_t(num_frames) * window_)
      return tl::unexpected(ErrorCode::SizeMismatch);
    if (max_batch_ != 0 && num_frames > max_batch_) return tl::unexpected(ErrorCode::SizeMismatch);

    // The session lives in memory, but a vanished artifact means the cache
    // was damaged underneath us; report it so the loader can rebuild.
    std::error_code ec;
    if (!fs::is_regular_file(model_path_, ec)) return tl::unexpected(ErrorCode::CacheCorrupt);

    const std::size_t L = labels_.size();
    try {
      // A fixed batch dimension must be filled exactly; short batches are zero padded.
      const std::uint32_t rows_in = (batched_ && max_batch_ != 0) ? max_batch_ : num_frames;
      std::vector<float> padded;
      std::span<const float> feed = frames;
      if (rows_in != num_frames) {
        padded.assign(std::size_t(rows_in) * window_, 0.0f);
        std::copy(frames.begin(), frames.end(), padded.begin());
        feed = padded;
      }

      std::vector<std::int64_t> shape;
      if (batched_) shape = {static_cast<std::int64_t>(rows_in), static_cast<std::int64_t>(window_)};
      else          shape = {static_cast<std::int64_t>(window_)};

      Ort::Value input = Ort::Value::CreateTensor<float>(
          memory_info_, const_cast<float*>(feed.data()), feed.size(),
          shape.data(), shape.size());

      const char* in_names[] = {input_name_.c_str()};
      const char* out_names[] = {output_name_.c_str()};
      auto outputs = session_->Run(Ort::RunOptions{nullptr}, in_names, &input, 1, out_names, 1);
      if (outputs.empty()) return tl::unexpected(ErrorCode::InferenceError);

      auto info = outputs[0].GetTensorTypeAndShapeInfo();
      const std::size_t count = info.GetElementCount();
      if (L == 0 || count == 0 || count % L != 0) return tl::unexpected(ErrorCode::InferenceError);
      const float* data = outputs[0].GetTensorData<float>();
      const std::size_t rows = count / L;

      kfr::univector<float> scores(std::size_t(num_frames) * L);
      if (batched_) {
        if (rows != rows_in) return tl::unexpected(ErrorCode::InferenceError);
        std::copy(data, data + std::size_t(num_frames) * L, scores.begin());
      } else {
        // A single waveform may yield several internal patches; average them.
        std::fill(scores.begin(), scores.end(), 0.0f);
        for (std::size_t r = 0; r < rows; ++r)
          for (std::size_t k = 0; k < L; ++k) scores[k] += data[r * L + k];
        const float inv = 1.0f / static_cast<float>(rows);
        for (auto& v : scores) v *= inv;
      }
      return scores;
    } catch (const Ort::Exception& e) {
      AED_LOG_WARN("onnx inference failed: " << e.what());
      return tl::unexpected(ErrorCode::InferenceError);
    } catch (const std::bad_alloc&) {
      return tl::unexpected(ErrorCode::OutOfMemory);
    }
  }

private:
  std::shared_ptr<Ort::Env> env_;
  std::unique_ptr<Ort::Session> session_;
  LabelSet labels_;
  fs::path model_path_;
  util::SampleRateHz sample_rate_hz_;
  std::uint32_t window_;
  std::uint64_t generation_;
  Ort::MemoryInfo memory_info_;
  std::string input_name_;
  std::string output_name_;
  bool batched_{false};
  std::uint32_t max_batch_{0};
};

// ==============================
// Runtime
// ==============================

class OnnxRuntime final : public IModelRuntime {
public:
  explicit OnnxRuntime(OnnxOptions opt) : opt_(std::move(opt)) {}

  Expected<ModelHandlePtr> open(const fs::path& dir, const CacheLayout& layout,
                                std::uint64_t generation) override {
    auto labels = LabelSet::load_file(dir / layout.class_map_file);
    if (!labels) {
      AED_LOG_WARN("class map unreadable: " << util::error_name(labels.error()));
      return tl::unexpected(labels.error() == ErrorCode::IOError ? ErrorCode::IOError
                                                                 : ErrorCode::CacheCorrupt);
    }

    const fs::path model_path = dir / layout.model_file;
    try {
      std::lock_guard<std::mutex> lk(mu_);
      if (!env_) env_ = std::make_shared<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "aed");

      Ort::SessionOptions options;
      if (opt_.intra_op_threads > 0) options.SetIntraOpNumThreads(opt_.intra_op_threads);
      if (opt_.optimize) options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

      auto session = std::make_unique<Ort::Session>(*env_, model_path.c_str(), options);
      ModelHandlePtr h = std::make_shared<const OnnxModelHandle>(
          env_, std::move(session), std::move(*labels), model_path, opt_, generation);
      return h;
    } catch (const Ort::Exception& e) {
      AED_LOG_WARN("onnx session for " << model_path.string() << " failed: " << e.what());
      return tl::unexpected(ErrorCode::CacheCorrupt);
    }
  }

private:
  OnnxOptions opt_;
  std::mutex mu_;
  std::shared_ptr<Ort::Env> env_;
};

} // namespace

std::uint32_t batch_limit_for_input_shape(std::span<const std::int64_t> shape) noexcept {
  if (shape.size() < 2) return 1;
  if (shape[0] <= 0) return 0;
  return static_cast<std::uint32_t>(std::min<std::int64_t>(shape[0], std::numeric_limits<std::uint32_t>::max()));
}

std::shared_ptr<IModelRuntime> make_onnx_runtime(OnnxOptions options) {
  return std::make_shared<OnnxRuntime>(std::move(options));
}
} // namespace aed::model
