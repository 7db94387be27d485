#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "aed/util/util.hpp"

namespace aed::shape {
//==============================
// Shaped result variants
//==============================

/** Whole-file ranking, best first. */
struct TopN {
  std::vector<util::DetectionEvent> ranked;
};

/** One above-threshold (frame, label) pair with its time span. */
struct TimelineEvent {
  double start_s{};
  double end_s{};
  util::DetectionEvent event;
};

/** All above-threshold labels of one frame; present even when empty. */
struct FrameEvents {
  util::FrameIndex frame_index{};
  double start_s{};
  double end_s{};
  std::vector<util::DetectionEvent> events; ///< label order
};

/**
 * Frame-granular detections.
 *  - events: flat list in (frame, label) order
 *  - frames: one entry per frame of the matrix, used for slot rendering
 */
struct Timeline {
  std::vector<TimelineEvent> events;
  std::vector<FrameEvents> frames;
};

/** Fixed-length window with the labels seen in it (first-seen order, no repeats). */
struct Segment {
  double start_s{};
  double end_s{};
  std::vector<std::string> labels;
};

/** Windows partitioning [0, num_frames * stride); the last one may be shorter. */
struct SegmentSummary {
  double segment_seconds{};
  std::vector<Segment> segments;
};

using ShapedResult = std::variant<TopN, Timeline, SegmentSummary>;

//==============================
// Derivations (pure)
//==============================

/** Per-label whole-file aggregate used for ranking. */
enum class Aggregation { Mean, Max };

/**
 * Purpose: Rank labels by their aggregate score over all frames.
 * Postconditions:
 *  - min(n, num_labels) entries, descending; ties keep label order
 *  - TopN(M, n).ranked is a prefix of TopN(M, n + 1).ranked
 *  - An empty matrix (0 frames) yields an empty ranking
 * Complexity: O(F * L + L log L).
 * Thread-safety: YES (pure).
 */
TopN top_n(const util::ProbabilityMatrix& M, std::size_t n,
           Aggregation agg = Aggregation::Mean);

/**
 * Lazy frame-by-frame view of the timeline. Frames come in ascending time;
 * reset() restarts from frame 0 and replays the identical sequence.
 * The matrix must outlive the cursor.
 * Thread-safety: NO (cursor position); the matrix may be shared.
 */
class TimelineCursor {
public:
  TimelineCursor(const util::ProbabilityMatrix& M, float threshold) noexcept
    : M_(&M), threshold_(threshold) {}

  /** Fill `out` with the next frame; false once all frames were produced. */
  bool next(FrameEvents& out);

  void reset() noexcept { next_ = 0; }

  [[nodiscard]] bool done() const noexcept { return next_ >= M_->num_frames; }

private:
  const util::ProbabilityMatrix* M_;
  float threshold_;
  std::uint32_t next_{0};
};

/**
 * Purpose: Materialize the full timeline (probability >= threshold, inclusive).
 * Postconditions:
 *  - frames.size() == num_frames; frame i spans [i*stride, (i+1)*stride)
 *  - threshold <= 0 keeps every label of every frame; threshold above every
 *    score gives empty event lists (not an error)
 * Complexity: O(F * L).
 */
Timeline timeline(const util::ProbabilityMatrix& M, float threshold);

/**
 * Purpose: Labels per fixed-length window.
 * Postconditions:
 *  - ceil(duration / segment_seconds) windows, contiguous, no overlap; empty
 *    windows are kept so the partition has no gaps
 *  - A frame belongs to the window containing its start time
 *  - InvalidArgument when segment_seconds is not a positive finite number
 */
util::Expected<SegmentSummary> segment_summary(const util::ProbabilityMatrix& M,
                                               float threshold, double segment_seconds);

//==============================
// All shapes at once
//==============================

struct ShapeParams {
  float threshold{0.2f};
  std::size_t top_n{20};
  double segment_seconds{3.0};
  Aggregation aggregation{Aggregation::Mean};
};

struct ShapedBundle {
  TopN top;
  Timeline timeline;
  SegmentSummary summary;
};

/** Derive every shape with one set of params. Fails only where segment_summary fails. */
util::Expected<ShapedBundle> shape_all(const util::ProbabilityMatrix& M, const ShapeParams& p);
} // namespace aed::shape
