#include "aed/shape/shape.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

namespace aed::shape {
using aed::util::DetectionEvent;
using aed::util::ErrorCode;
using aed::util::Expected;
using aed::util::LabelIndex;
using aed::util::ProbabilityMatrix;

namespace {

DetectionEvent make_event(const ProbabilityMatrix& M, LabelIndex k, float p) {
  return DetectionEvent{k, std::string(util::label_name(M, k)), p};
}

// Window index of a frame start; the epsilon absorbs i*stride rounding.
std::size_t window_of(double t, double seg) {
  return static_cast<std::size_t>(std::floor(t / seg + 1e-9));
}

} // namespace

TopN top_n(const ProbabilityMatrix& M, std::size_t n, Aggregation agg) {
  TopN out;
  const std::size_t L = M.num_labels;
  if (M.num_frames == 0 || L == 0 || n == 0) return out;

  std::vector<double> acc(L, agg == Aggregation::Max ? -1.0 : 0.0);
  for (std::uint32_t i = 0; i < M.num_frames; ++i) {
    const auto row = util::matrix_row(M, i);
    for (std::size_t k = 0; k < L; ++k) {
      if (agg == Aggregation::Max) acc[k] = std::max(acc[k], double(row[k]));
      else acc[k] += row[k];
    }
  }
  if (agg == Aggregation::Mean) {
    for (auto& v : acc) v /= double(M.num_frames);
  }

  std::vector<std::size_t> order(L);
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(),
                   [&acc](std::size_t a, std::size_t b) { return acc[a] > acc[b]; });

  const std::size_t m = std::min(n, L);
  out.ranked.reserve(m);
  for (std::size_t r = 0; r < m; ++r) {
    const auto k = static_cast<LabelIndex>(order[r]);
    out.ranked.push_back(make_event(M, k, static_cast<float>(acc[k])));
  }
  return out;
}

bool TimelineCursor::next(FrameEvents& out) {
  if (done()) return false;
  const std::uint32_t i = next_++;
  const double stride = M_->frame_stride_s;

  out.frame_index = i;
  out.start_s = double(i) * stride;
  out.end_s = out.start_s + stride;
  out.events.clear();

  const auto row = util::matrix_row(*M_, i);
  for (std::size_t k = 0; k < row.size(); ++k) {
    if (row[k] >= threshold_) out.events.push_back(make_event(*M_, static_cast<LabelIndex>(k), row[k]));
  }
  return true;
}

Timeline timeline(const ProbabilityMatrix& M, float threshold) {
  Timeline tl;
  tl.frames.reserve(M.num_frames);

  TimelineCursor cur(M, threshold);
  FrameEvents fe;
  while (cur.next(fe)) {
    for (const auto& e : fe.events) tl.events.push_back(TimelineEvent{fe.start_s, fe.end_s, e});
    tl.frames.push_back(fe);
  }
  return tl;
}

Expected<SegmentSummary> segment_summary(const ProbabilityMatrix& M, float threshold,
                                         double segment_seconds) {
  if (!std::isfinite(segment_seconds) || segment_seconds <= 0.0)
    return tl::unexpected(ErrorCode::InvalidArgument);

  SegmentSummary s;
  s.segment_seconds = segment_seconds;
  const double duration = double(M.num_frames) * M.frame_stride_s;
  if (M.num_frames == 0 || duration <= 0.0) return s;

  const auto windows = static_cast<std::size_t>(
      std::max(1.0, std::ceil(duration / segment_seconds - 1e-9)));
  s.segments.resize(windows);
  for (std::size_t j = 0; j < windows; ++j) {
    s.segments[j].start_s = double(j) * segment_seconds;
    s.segments[j].end_s = std::min(double(j + 1) * segment_seconds, duration);
  }

  std::vector<std::unordered_set<LabelIndex>> seen(windows);
  for (std::uint32_t i = 0; i < M.num_frames; ++i) {
    const std::size_t j = std::min(window_of(double(i) * M.frame_stride_s, segment_seconds), windows - 1);
    const auto row = util::matrix_row(M, i);
    for (std::size_t k = 0; k < row.size(); ++k) {
      if (row[k] < threshold) continue;
      const auto idx = static_cast<LabelIndex>(k);
      if (seen[j].insert(idx).second) s.segments[j].labels.emplace_back(util::label_name(M, idx));
    }
  }
  return s;
}

Expected<ShapedBundle> shape_all(const ProbabilityMatrix& M, const ShapeParams& p) {
  auto summary = segment_summary(M, p.threshold, p.segment_seconds);
  if (!summary) return tl::unexpected(summary.error());

  ShapedBundle b;
  b.top = top_n(M, p.top_n, p.aggregation);
  b.timeline = timeline(M, p.threshold);
  b.summary = std::move(*summary);
  return b;
}
} // namespace aed::shape
