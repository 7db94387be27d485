#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "aed/audio/normalizer.hpp"
#include "aed/batch/units.hpp"
#include "aed/infer/infer.hpp"
#include "aed/model/model.hpp"
#include "aed/persist/persist.hpp"
#include "aed/shape/shape.hpp"
#include "aed/store/store.hpp"
#include "aed/util/util.hpp"

namespace aed::batch {
//==============================
// Report
//==============================

/** Pipeline stage that failed for a unit. */
enum class Stage : std::uint8_t { Fetch, Normalize, Infer, Shape, Persist };

std::string_view stage_name(Stage s) noexcept;

/** One failed unit; message reads "<stage>: <ErrorName>: <description> (<context>)". */
struct UnitError {
  std::string unit_id;
  Stage stage{};
  util::ErrorCode code{util::ErrorCode::None};
  std::string message;
};

struct BatchCounts {
  std::size_t total{0}; ///< units handed to run()
  std::size_t processed{0};
  std::size_t skipped{0};
  std::size_t errored{0};
};

/**
 * Outcome of one run. Each list keeps input order.
 * total == processed + skipped + errored + not_attempted.size().
 */
struct BatchReport {
  std::vector<std::string> processed;
  std::vector<std::string> skipped;
  std::vector<UnitError> errors;
  std::vector<std::string> not_attempted; ///< left over when the deadline passed
  bool deadline_exceeded{false};
  BatchCounts counts;
  std::chrono::milliseconds elapsed{0};
  std::uint64_t model_recoveries{0}; ///< self-heals performed during this run
};

/** Same partition (processed/skipped/errors by unit and code), ignoring timing. */
bool same_partition(const BatchReport& a, const BatchReport& b) noexcept;

/** Response payload: lists, counts, execution_time_ms. */
std::string report_to_json(const BatchReport& r);

//==============================
// Orchestrator
//==============================

struct RunOptions {
  shape::ShapeParams shape{};
  audio::NormalizeParams normalize{};
  store::FetchOptions fetch{};
  std::optional<util::Deadline> deadline; ///< checked before each unit
};

/**
 * Sequential fetch → normalize → infer → shape → persist over a list of units.
 *
 * Classification per unit:
 *  - NotFound from the source → skipped
 *  - any other failure, or a failed status update → error (batch continues)
 *  - otherwise → processed
 * CacheCorrupt from inference triggers one loader recovery and one retry of
 * that unit; it is reported only if the retry fails too.
 *
 * Thread-safety: NO for a single orchestrator (it owns the normalizer);
 * separate orchestrators may share the loader and the stores.
 */
class BatchOrchestrator {
public:
  BatchOrchestrator(model::ModelLoader& loader,
                    audio::ISignalNormalizer& normalizer,
                    const infer::IInferenceEngine& engine,
                    store::IAudioSource& source,
                    persist::PersistenceAdapter& persistence)
    : loader_(loader), normalizer_(normalizer), engine_(engine), source_(source),
      persistence_(persistence) {}

  /**
   * Purpose: Process units in order and report the partition.
   * Postconditions:
   *  - ModelUnavailable when no model could be acquired (no partial report)
   *  - otherwise a complete report, partial only when opts.deadline passed
   * Complexity: O(units); memory bounded by one unit's waveform and matrix.
   */
  [[nodiscard]] util::Expected<BatchReport> run(std::span<const AudioUnit> units,
                                                const RunOptions& opts);

private:
  enum class Outcome { Processed, Skipped, Error };

  Outcome process(const AudioUnit& unit, const RunOptions& opts,
                  model::ModelHandlePtr& model, UnitError& err, bool& model_lost);

  util::Expected<util::ProbabilityMatrix> infer_with_recovery(const util::Waveform& w,
                                                              model::ModelHandlePtr& model,
                                                              bool& model_lost);

  model::ModelLoader& loader_;
  audio::ISignalNormalizer& normalizer_;
  const infer::IInferenceEngine& engine_;
  store::IAudioSource& source_;
  persist::PersistenceAdapter& persistence_;
};

/** Slot names of the processed grid units, in report order. */
std::vector<std::string> processed_slots(const BatchReport& r, std::span<const AudioUnit> units);
} // namespace aed::batch
