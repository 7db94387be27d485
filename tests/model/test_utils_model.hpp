#pragma once
#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "aed/model/labels.hpp"
#include "aed/model/model.hpp"
#include "io/test_utils.hpp"

namespace testmodel {
namespace fs = std::filesystem;
using aed::util::ErrorCode;
using aed::util::Expected;

/** Labels of the fake classifier. */
inline std::vector<std::string> fake_label_names() { return {"Speech", "Music", "Silence", "Dog"}; }

inline std::string class_map_csv(const std::vector<std::string>& names) {
  std::string s = "index,mid,display_name\n";
  for (size_t i = 0; i < names.size(); ++i) {
    s += std::to_string(i) + ",/m/" + std::to_string(i) + ",\"" + names[i] + "\"\n";
  }
  return s;
}

inline void write_text(const fs::path& p, const std::string& body) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << body;
}

/**
 * Deterministic scores from frame energy:
 *  Speech = min(1, 4 * rms), Music = min(1, 2 * rms), Silence = 1 - Speech, Dog = 0.
 * Reports CacheCorrupt once `model_file` disappears, like the ONNX handle.
 */
class FakeModelHandle final : public aed::model::IModelHandle {
public:
  FakeModelHandle(aed::model::LabelSet labels, fs::path model_file, std::uint64_t generation,
                  std::uint32_t window = 15600, std::uint32_t max_batch = 0)
    : labels_(std::move(labels)), model_file_(std::move(model_file)), generation_(generation),
      window_(window), max_batch_(max_batch) {}

  const aed::model::LabelSet& labels() const noexcept override { return labels_; }
  aed::util::SampleRateHz sample_rate_hz() const noexcept override { return 16000; }
  std::uint32_t frame_window_samples() const noexcept override { return window_; }
  std::uint32_t max_batch_frames() const noexcept override { return max_batch_; }
  std::uint64_t generation() const noexcept override { return generation_; }

  Expected<kfr::univector<float>> classify(std::span<const float> frames,
                                           std::uint32_t num_frames) const override {
    ++calls;
    if (!model_file_.empty() && !fs::exists(model_file_)) return tl::unexpected(ErrorCode::CacheCorrupt);
    if (num_frames == 0 || frames.size() != size_t(num_frames) * window_)
      return tl::unexpected(ErrorCode::SizeMismatch);
    if (max_batch_ && num_frames > max_batch_) return tl::unexpected(ErrorCode::SizeMismatch);

    const size_t L = labels_.size();
    kfr::univector<float> out(size_t(num_frames) * L, 0.0f);
    for (std::uint32_t f = 0; f < num_frames; ++f) {
      double acc = 0.0;
      for (std::uint32_t i = 0; i < window_; ++i) {
        const double v = frames[size_t(f) * window_ + i];
        acc += v * v;
      }
      const float rms = float(std::sqrt(acc / double(window_)));
      float* row = out.data() + size_t(f) * L;
      if (L > 0) row[0] = std::min(1.0f, 4.0f * rms);
      if (L > 1) row[1] = std::min(1.0f, 2.0f * rms);
      if (L > 2) row[2] = 1.0f - row[0];
    }
    batches.push_back(num_frames);
    return out;
  }

  mutable std::atomic<int> calls{0};
  mutable std::vector<std::uint32_t> batches; // frames per classify() call

private:
  aed::model::LabelSet labels_;
  fs::path model_file_;
  std::uint64_t generation_;
  std::uint32_t window_;
  std::uint32_t max_batch_;
};

/** Opens a cache directory by parsing its class map; the model file only has to exist. */
class FakeRuntime final : public aed::model::IModelRuntime {
public:
  Expected<aed::model::ModelHandlePtr> open(const fs::path& dir, const aed::model::CacheLayout& layout,
                                            std::uint64_t generation) override {
    ++opens;
    if (fail_opens > 0) {
      --fail_opens;
      return tl::unexpected(ErrorCode::CacheCorrupt);
    }
    if (!fs::exists(dir / layout.model_file)) return tl::unexpected(ErrorCode::CacheCorrupt);
    auto labels = aed::model::LabelSet::load_file(dir / layout.class_map_file);
    if (!labels) return tl::unexpected(ErrorCode::CacheCorrupt);
    aed::model::ModelHandlePtr h = std::make_shared<const FakeModelHandle>(
        std::move(*labels), dir / layout.model_file, generation, window, max_batch);
    return h;
  }

  std::atomic<int> opens{0};
  int fail_opens{0};
  std::uint32_t window{15600};
  std::uint32_t max_batch{0};
};

/** Wraps a real source and counts fetches; can be made unreachable. */
class CountingSource final : public aed::model::IModelSource {
public:
  explicit CountingSource(std::shared_ptr<aed::model::IModelSource> inner) : inner_(std::move(inner)) {}

  Expected<void> fetch_into(const fs::path& dir, const aed::model::CacheLayout& layout) override {
    ++fetches;
    if (!reachable) return tl::unexpected(ErrorCode::Unavailable);
    return inner_->fetch_into(dir, layout);
  }

  std::atomic<int> fetches{0};
  std::atomic<bool> reachable{true};

private:
  std::shared_ptr<aed::model::IModelSource> inner_;
};

/** Mirror directory with a fake model file and a class map, plus an empty cache location. */
struct ModelFixture {
  testio::TempDir root{"aed_model"};
  fs::path mirror = root.path() / "mirror";
  fs::path cache = root.path() / "cache" / "yamnet";
  std::shared_ptr<FakeRuntime> runtime = std::make_shared<FakeRuntime>();
  std::shared_ptr<CountingSource> source;

  explicit ModelFixture(std::vector<std::string> names = fake_label_names()) {
    fs::create_directories(mirror);
    write_text(mirror / "yamnet.onnx", "not really onnx");
    write_text(mirror / "yamnet_class_map.csv", class_map_csv(names));
    source = std::make_shared<CountingSource>(aed::model::make_mirror_model_source(mirror));
  }

  aed::model::LoaderOptions options(std::size_t labels = 4) const {
    aed::model::LoaderOptions o;
    o.cache_dir = cache;
    o.retry_delay = std::chrono::milliseconds(0);
    o.expected_labels = labels;
    return o;
  }
};
} // namespace testmodel
