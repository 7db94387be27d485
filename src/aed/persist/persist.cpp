#include "aed/persist/persist.hpp"

#include <ctime>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>
#include <utility>

#include "aed/persist/json.hpp"
#include "aed/util/logging.hpp"

namespace aed::persist {
using aed::util::ErrorCode;
using aed::util::Expected;
namespace fs = std::filesystem;

std::string_view sink_name(Sink s) noexcept {
  switch (s) {
    case Sink::LocalArtifact:
      return "local_artifact";
    case Sink::ResultStore:
      return "result_store";
    case Sink::Upload:
      return "upload";
    case Sink::Status:
      return "status";
  }
  return "unknown";
}

bool PersistOutcome::ok(Sink s) const noexcept {
  for (const auto& r : sinks) {
    if (r.sink == s) return r.ok;
  }
  return false;
}

Expected<void> write_file_atomic(const fs::path& path, std::string_view contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) return tl::unexpected(ErrorCode::IOError);
  }
  fs::path tmp = path;
  tmp += ".tmp-" + std::to_string(::getpid());
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return tl::unexpected(ErrorCode::IOError);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      return tl::unexpected(ErrorCode::IOError);
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return tl::unexpected(ErrorCode::IOError);
  }
  return {};
}

std::string utc_timestamp() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::string artifact_relpath(const batch::AudioUnit& unit) {
  if (unit.meta) {
    return unit.meta->device_id + "/" + unit.meta->date + "/sed/" + unit.meta->slot + ".json";
  }
  // Percent-escape so distinct keys never share a file.
  std::string flat;
  flat.reserve(unit.key.size() + 5);
  for (const char c : unit.key) {
    switch (c) {
      case '%':
        flat += "%25";
        break;
      case '/':
        flat += "%2F";
        break;
      case '\\':
        flat += "%5C";
        break;
      default:
        flat += c;
    }
  }
  return flat + ".json";
}

std::string artifact_slot(const batch::AudioUnit& unit) {
  return unit.meta ? unit.meta->slot : unit.key;
}

// -----------------------------
// Directory uploader
// -----------------------------

namespace {

class DirectoryUploader final : public IArtifactUploader {
public:
  explicit DirectoryUploader(fs::path root) : root_(std::move(root)) {}

  Expected<void> upload(std::string_view remote_key, const fs::path& local_file,
                        std::chrono::milliseconds timeout) override {
    const auto deadline = util::Deadline::after(timeout);
    std::ifstream in(local_file, std::ios::binary);
    if (!in) return tl::unexpected(ErrorCode::NotFound);
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return tl::unexpected(ErrorCode::IOError);
    if (deadline.expired()) return tl::unexpected(ErrorCode::Timeout);
    return write_file_atomic(root_ / std::string(remote_key), body);
  }

private:
  fs::path root_;
};

} // namespace

std::unique_ptr<IArtifactUploader> make_directory_uploader(fs::path root) {
  return std::make_unique<DirectoryUploader>(std::move(root));
}

// -----------------------------
// Adapter
// -----------------------------

PersistenceAdapter::PersistenceAdapter(PersistOptions opts,
                                       std::shared_ptr<store::IStatusStore> status,
                                       std::shared_ptr<store::IResultStore> results,
                                       std::shared_ptr<IArtifactUploader> uploader)
  : opts_(std::move(opts)), status_(std::move(status)), results_(std::move(results)),
    uploader_(std::move(uploader)) {}

namespace {

// Window keys: "top_n" for the ranking, "t=<start ms>" per frame with detections.
// Rows of an earlier run are erased first so a rerun leaves no stale frames.
Expected<void> put_results(store::IResultStore& rs, std::string_view unit_id,
                           const shape::ShapedBundle& b, std::chrono::milliseconds timeout) {
  auto erased = rs.erase_unit(unit_id, timeout);
  if (!erased) return tl::unexpected(erased.error());
  if (*erased > 0) AED_LOG_DEBUG("replaced " << *erased << " result rows of " << unit_id);
  if (auto r = rs.put(unit_id, "top_n", b.top.ranked, timeout); !r) return r;
  for (const auto& fr : b.timeline.frames) {
    if (fr.events.empty()) continue;
    const auto ms = static_cast<long long>(fr.start_s * 1000.0 + 0.5);
    const std::string window = "t=" + std::to_string(ms);
    if (auto r = rs.put(unit_id, window, fr.events, timeout); !r) return r;
  }
  return {};
}

} // namespace

PersistOutcome PersistenceAdapter::persist(const batch::AudioUnit& unit,
                                           const shape::ShapedBundle& shaped,
                                           bool truncated) {
  PersistOutcome out;
  auto record = [&out, &unit](Sink s, const Expected<void>& r) {
    out.sinks.push_back(SinkResult{s, r.has_value(), r ? ErrorCode::None : r.error()});
    if (!r) {
      AED_LOG_WARN("sink " << sink_name(s) << " failed for " << unit.key << ": "
                   << util::error_name(r.error()));
    }
  };

  const std::string rel = artifact_relpath(unit);
  if (!opts_.artifact_root.empty()) {
    const fs::path path = opts_.artifact_root / rel;
    auto r = write_file_atomic(path, artifact_json(artifact_slot(unit), shaped, truncated));
    record(Sink::LocalArtifact, r);
    if (r) out.artifact_path = path;
  }

  if (results_) record(Sink::ResultStore, put_results(*results_, unit.key, shaped, opts_.timeout));

  if (uploader_ && out.artifact_path) {
    record(Sink::Upload, uploader_->upload(rel, *out.artifact_path, opts_.timeout));
  }

  // Primary sink last: the status record is what downstream consumers trust.
  if (!status_) {
    out.primary_error = ErrorCode::Unavailable;
    record(Sink::Status, tl::unexpected(ErrorCode::Unavailable));
    return out;
  }
  auto st = status_->mark_completed(unit.key, opts_.status_flag, opts_.timeout);
  if (!st) {
    out.primary_error = st.error();
    record(Sink::Status, tl::unexpected(st.error()));
    return out;
  }
  record(Sink::Status, {});
  out.primary_ok = true;
  if (*st == store::StatusUpdate::NoMatchingRecord) {
    out.record_missing = true;
    AED_LOG_WARN("no status record for " << unit.key << ", " << opts_.status_flag << " not set");
  }
  {
    auto line = AED_LOG_DEBUG_STREAM();
    line << "persisted " << unit.key << ":";
    for (const auto& r : out.sinks) line << " " << sink_name(r.sink) << "=" << (r.ok ? "ok" : "failed");
  }
  return out;
}

Expected<fs::path> PersistenceAdapter::write_batch_summary(std::string_view device_id,
                                                           std::string_view date,
                                                           std::size_t available_slots,
                                                           const std::vector<std::string>& processed_slots) {
  if (opts_.artifact_root.empty()) return tl::unexpected(ErrorCode::Unavailable);
  if (!batch::is_valid_device_id(device_id) || !batch::is_valid_date(date))
    return tl::unexpected(ErrorCode::InvalidArgument);

  JsonWriter w;
  w.begin_object();
  w.key("device_id").value(device_id);
  w.key("date").value(date);
  w.key("total_processed_slots").value(static_cast<std::uint64_t>(processed_slots.size()));
  w.key("total_available_slots").value(static_cast<std::uint64_t>(available_slots));
  w.key("processed_slot_names").begin_array();
  for (const auto& s : processed_slots) w.value(s);
  w.end_array();
  w.key("processing_timestamp").value(utc_timestamp());
  w.end_object();

  const fs::path path = opts_.artifact_root / std::string(device_id) / std::string(date) / "sed" /
                        "processing_summary.json";
  if (auto r = write_file_atomic(path, w.str()); !r) return tl::unexpected(r.error());
  return path;
}
} // namespace aed::persist
