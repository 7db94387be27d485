#include "aed/batch/batch.hpp"

#include <utility>

#include "aed/persist/json.hpp"
#include "aed/util/logging.hpp"

namespace aed::batch {
using aed::util::ErrorCode;
using aed::util::Expected;

std::string_view stage_name(Stage s) noexcept {
  switch (s) {
    case Stage::Fetch:
      return "fetch";
    case Stage::Normalize:
      return "normalize";
    case Stage::Infer:
      return "infer";
    case Stage::Shape:
      return "shape";
    case Stage::Persist:
      return "persist";
  }
  return "unknown";
}

namespace {

UnitError make_error(const AudioUnit& unit, Stage stage, ErrorCode code, std::string_view context) {
  std::string msg;
  msg.append(stage_name(stage)).append(": ");
  msg.append(util::error_name(code)).append(": ");
  msg.append(util::error_description(code));
  if (!context.empty()) msg.append(" (").append(context).append(")");
  return UnitError{unit.key, stage, code, std::move(msg)};
}

} // namespace

// -----------------------------
// Per-unit pipeline
// -----------------------------

Expected<util::ProbabilityMatrix>
BatchOrchestrator::infer_with_recovery(const util::Waveform& w, model::ModelHandlePtr& model,
                                       bool& model_lost) {
  auto M = engine_.infer(w, *model);
  if (M || M.error() != ErrorCode::CacheCorrupt) return M;

  AED_LOG_WARN("model cache corrupt (generation " << model->generation() << "), recovering");
  auto healed = loader_.recover(model);
  if (!healed) {
    model_lost = true;
    return tl::unexpected(ErrorCode::ModelUnavailable);
  }
  model = *healed;
  // One retry per unit; a second CacheCorrupt is this unit's error.
  return engine_.infer(w, *model);
}

BatchOrchestrator::Outcome BatchOrchestrator::process(const AudioUnit& unit, const RunOptions& opts,
                                                      model::ModelHandlePtr& model, UnitError& err,
                                                      bool& model_lost) {
  std::vector<std::byte> fetched;
  std::span<const std::byte> bytes;
  if (unit.payload) {
    bytes = *unit.payload;
  } else {
    auto got = source_.fetch(unit.key, opts.fetch);
    if (!got) {
      if (got.error() == ErrorCode::NotFound) {
        AED_LOG_INFO("no audio for " << unit.key << ", skipped");
        return Outcome::Skipped;
      }
      err = make_error(unit, Stage::Fetch, got.error(), "");
      return Outcome::Error;
    }
    fetched = std::move(*got);
    bytes = fetched;
  }

  auto w = normalizer_.normalize(bytes, opts.normalize);
  if (!w) {
    err = make_error(unit, Stage::Normalize, w.error(), std::to_string(bytes.size()) + " bytes");
    return Outcome::Error;
  }
  if (w->truncated) {
    AED_LOG_DEBUG(unit.key << " longer than " << opts.normalize.max_duration_s << " s, truncated");
  }

  if (!model) {
    auto h = loader_.acquire();
    if (!h) {
      model_lost = true;
      err = make_error(unit, Stage::Infer, h.error(), "model acquisition");
      return Outcome::Error;
    }
    model = *h;
  }

  auto M = infer_with_recovery(*w, model, model_lost);
  if (!M) {
    err = make_error(unit, Stage::Infer, M.error(),
                     std::to_string(w->samples.size()) + " samples");
    return Outcome::Error;
  }

  auto shaped = shape::shape_all(*M, opts.shape);
  if (!shaped) {
    err = make_error(unit, Stage::Shape, shaped.error(), "");
    return Outcome::Error;
  }

  const auto out = persistence_.persist(unit, *shaped, w->truncated);
  if (!out.primary_ok) {
    err = make_error(unit, Stage::Persist, ErrorCode::PersistenceError,
                     std::string("status update: ") + std::string(util::error_name(out.primary_error)));
    return Outcome::Error;
  }
  return Outcome::Processed;
}

// -----------------------------
// Run
// -----------------------------

Expected<BatchReport> BatchOrchestrator::run(std::span<const AudioUnit> units,
                                             const RunOptions& opts) {
  const auto t0 = std::chrono::steady_clock::now();
  const auto recoveries_before = loader_.recoveries();

  BatchReport rep;
  rep.counts.total = units.size();
  model::ModelHandlePtr model;

  for (std::size_t i = 0; i < units.size(); ++i) {
    const auto& unit = units[i];
    if (opts.deadline && opts.deadline->expired()) {
      rep.deadline_exceeded = true;
      for (std::size_t j = i; j < units.size(); ++j) rep.not_attempted.push_back(units[j].key);
      AED_LOG_WARN("batch deadline passed, " << rep.not_attempted.size() << " units not attempted");
      break;
    }

    UnitError err;
    bool model_lost = false;
    const auto outcome = process(unit, opts, model, err, model_lost);
    if (model_lost) {
      AED_LOG_ERROR("no usable model, aborting batch at " << unit.key);
      return tl::unexpected(ErrorCode::ModelUnavailable);
    }

    switch (outcome) {
      case Outcome::Processed:
        rep.processed.push_back(unit.key);
        break;
      case Outcome::Skipped:
        rep.skipped.push_back(unit.key);
        break;
      case Outcome::Error:
        AED_LOG_WARN(unit.key << " failed: " << err.message);
        rep.errors.push_back(std::move(err));
        break;
    }
  }

  rep.counts.processed = rep.processed.size();
  rep.counts.skipped = rep.skipped.size();
  rep.counts.errored = rep.errors.size();
  rep.model_recoveries = loader_.recoveries() - recoveries_before;
  rep.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - t0);

  AED_LOG_INFO("batch done: " << rep.counts.processed << " processed, " << rep.counts.skipped
               << " skipped, " << rep.counts.errored << " errors of " << rep.counts.total
               << " in " << rep.elapsed.count() << " ms");
  return rep;
}

// -----------------------------
// Report helpers
// -----------------------------

bool same_partition(const BatchReport& a, const BatchReport& b) noexcept {
  if (a.processed != b.processed || a.skipped != b.skipped || a.not_attempted != b.not_attempted) {
    return false;
  }
  if (a.errors.size() != b.errors.size()) return false;
  for (std::size_t i = 0; i < a.errors.size(); ++i) {
    const auto& x = a.errors[i];
    const auto& y = b.errors[i];
    if (x.unit_id != y.unit_id || x.stage != y.stage || x.code != y.code) return false;
  }
  return true;
}

std::string report_to_json(const BatchReport& r) {
  persist::JsonWriter w;
  auto ids = [&w](const char* name, const std::vector<std::string>& v) {
    w.key(name).begin_array();
    for (const auto& s : v) w.value(s);
    w.end_array();
  };

  w.begin_object();
  ids("processed", r.processed);
  ids("skipped", r.skipped);
  w.key("errors").begin_array();
  for (const auto& e : r.errors) {
    w.begin_object();
    w.key("unit").value(e.unit_id);
    w.key("stage").value(stage_name(e.stage));
    w.key("error").value(util::error_name(e.code));
    w.key("message").value(e.message);
    w.end_object();
  }
  w.end_array();
  if (r.deadline_exceeded) ids("not_attempted", r.not_attempted);
  w.key("deadline_exceeded").value(r.deadline_exceeded);
  w.key("counts").begin_object();
  w.key("total").value(static_cast<std::uint64_t>(r.counts.total));
  w.key("processed").value(static_cast<std::uint64_t>(r.counts.processed));
  w.key("skipped").value(static_cast<std::uint64_t>(r.counts.skipped));
  w.key("errored").value(static_cast<std::uint64_t>(r.counts.errored));
  w.end_object();
  w.key("model_recoveries").value(static_cast<std::uint64_t>(r.model_recoveries));
  w.key("execution_time_ms").value(static_cast<std::int64_t>(r.elapsed.count()));
  w.end_object();
  return w.str();
}

std::vector<std::string> processed_slots(const BatchReport& r, std::span<const AudioUnit> units) {
  std::vector<std::string> out;
  for (const auto& id : r.processed) {
    for (const auto& u : units) {
      if (u.key == id) {
        out.push_back(u.meta ? u.meta->slot : u.key);
        break;
      }
    }
  }
  return out;
}
} // namespace aed::batch
