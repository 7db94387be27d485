#include "aed/infer/infer.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

#include "aed/util/logging.hpp"

namespace aed::infer {
using aed::util::ErrorCode;
using aed::util::Expected;
using aed::util::FrameBlock;
using aed::util::ProbabilityMatrix;

std::uint32_t frame_count(std::size_t n, std::uint32_t hop) noexcept {
  if (n == 0 || hop == 0) return 0;
  return static_cast<std::uint32_t>((n + hop - 1) / hop);
}

Expected<FrameBlock> make_frames(std::span<const float> x, const FramingParams& p,
                                 std::uint32_t first, std::uint32_t count) {
  if (p.window_samples == 0 || p.hop_samples == 0) return tl::unexpected(ErrorCode::InvalidArgument);
  const std::uint32_t total = frame_count(x.size(), p.hop_samples);
  if (std::uint64_t(first) + count > total) return tl::unexpected(ErrorCode::InvalidArgument);

  FrameBlock fb;
  fb.frame_size = p.window_samples;
  fb.hop_size = p.hop_samples;
  fb.num_frames = count;
  try {
    fb.data.resize(std::size_t(count) * p.window_samples);
  } catch (const std::bad_alloc&) {
    return tl::unexpected(ErrorCode::OutOfMemory);
  }
  std::fill(fb.data.begin(), fb.data.end(), 0.0f);

  for (std::uint32_t i = 0; i < count; ++i) {
    const std::size_t start = std::size_t(first + i) * p.hop_samples;
    const std::size_t avail = std::min<std::size_t>(p.window_samples, x.size() - start);
    auto dst = util::frame_view(fb, i);
    std::memcpy(dst.data(), x.data() + start, avail * sizeof(float));
  }
  return fb;
}

Expected<FrameBlock> make_frames(std::span<const float> x, const FramingParams& p) {
  return make_frames(x, p, 0, frame_count(x.size(), p.hop_samples));
}

namespace {

class BatchedEngine final : public IInferenceEngine {
public:
  explicit BatchedEngine(FramingParams p) : p_(p) {}

  Expected<ProbabilityMatrix> infer(const util::Waveform& w,
                                    const model::IModelHandle& model) const override {
    if (w.samples.empty()) return tl::unexpected(ErrorCode::InferenceError);
    if (w.sample_rate_hz == 0 || w.sample_rate_hz != model.sample_rate_hz()) {
      AED_LOG_WARN("waveform at " << w.sample_rate_hz << " Hz, model expects "
                   << model.sample_rate_hz() << " Hz");
      return tl::unexpected(ErrorCode::InferenceError);
    }
    if (p_.window_samples != model.frame_window_samples() || p_.hop_samples == 0)
      return tl::unexpected(ErrorCode::InferenceError);

    const std::size_t L = model.labels().size();
    if (L == 0 || L > std::numeric_limits<std::uint16_t>::max())
      return tl::unexpected(ErrorCode::InferenceError);

    const auto x = util::as_span(w);
    const std::uint32_t total = frame_count(x.size(), p_.hop_samples);

    std::uint32_t batch = std::max<std::uint32_t>(1, p_.batch_frames);
    if (model.max_batch_frames() != 0) batch = std::min(batch, model.max_batch_frames());

    ProbabilityMatrix M;
    M.num_frames = total;
    M.num_labels = static_cast<std::uint16_t>(L);
    M.frame_stride_s = double(p_.hop_samples) / double(w.sample_rate_hz);
    M.labels = model.labels().names();
    M.scores.resize(std::size_t(total) * L);

    for (std::uint32_t first = 0; first < total; first += batch) {
      const std::uint32_t count = std::min(batch, total - first);
      auto frames = make_frames(x, p_, first, count);
      if (!frames) return tl::unexpected(frames.error());

      auto scores = model.classify(std::span<const float>(frames->data.data(), frames->data.size()), count);
      if (!scores) {
        const auto e = scores.error();
        if (e == ErrorCode::CacheCorrupt || e == ErrorCode::OutOfMemory) return tl::unexpected(e);
        return tl::unexpected(ErrorCode::InferenceError);
      }
      if (scores->size() != std::size_t(count) * L) return tl::unexpected(ErrorCode::InferenceError);

      std::copy(scores->begin(), scores->end(), M.scores.begin() + std::size_t(first) * L);
      AED_LOG_DEBUG("frames " << first << ".." << (first + count) << " of " << total);
    }
    return M;
  }

private:
  FramingParams p_;
};

} // namespace

std::unique_ptr<IInferenceEngine> make_default_engine(FramingParams params) {
  return std::make_unique<BatchedEngine>(params);
}
} // namespace aed::infer
