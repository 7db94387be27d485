#include "aed/store/store.hpp"

#include <utility>

namespace aed::store {
using aed::util::DetectionEvent;
using aed::util::ErrorCode;
using aed::util::Expected;

// -----------------------------
// MemoryAudioSource
// -----------------------------

void MemoryAudioSource::put(std::string key, std::vector<std::byte> bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  objects_[std::move(key)] = std::move(bytes);
}

void MemoryAudioSource::erase(std::string_view key) {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = objects_.find(key); it != objects_.end()) objects_.erase(it);
}

Expected<std::vector<std::byte>> MemoryAudioSource::fetch(std::string_view key,
                                                          const FetchOptions& /*opts*/) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(key);
  if (it == objects_.end()) return tl::unexpected(ErrorCode::NotFound);
  return it->second;
}

// -----------------------------
// MemoryStatusStore
// -----------------------------

Expected<void> MemoryStatusStore::register_unit(std::string_view unit_id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (records_.find(unit_id) == records_.end()) records_.emplace(std::string(unit_id), std::map<std::string, std::string>{});
  return {};
}

Expected<StatusUpdate> MemoryStatusStore::mark_completed(std::string_view unit_id,
                                                         std::string_view flag,
                                                         std::chrono::milliseconds /*timeout*/) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = records_.find(unit_id);
  if (it == records_.end()) return StatusUpdate::NoMatchingRecord;
  it->second[std::string(flag)] = std::string(kCompletedValue);
  return StatusUpdate::Updated;
}

Expected<std::optional<std::string>> MemoryStatusStore::flag_value(std::string_view unit_id,
                                                                   std::string_view flag) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = records_.find(unit_id);
  if (it == records_.end()) return std::optional<std::string>{};
  auto f = it->second.find(std::string(flag));
  if (f == it->second.end()) return std::optional<std::string>{};
  return std::optional<std::string>{f->second};
}

// -----------------------------
// MemoryResultStore
// -----------------------------

Expected<void> MemoryResultStore::put(std::string_view unit_id, std::string_view window_key,
                                      const std::vector<DetectionEvent>& events,
                                      std::chrono::milliseconds /*timeout*/) {
  std::lock_guard<std::mutex> lk(mu_);
  rows_[{std::string(unit_id), std::string(window_key)}] = events;
  return {};
}

Expected<std::vector<DetectionEvent>> MemoryResultStore::get(std::string_view unit_id,
                                                             std::string_view window_key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = rows_.find({std::string(unit_id), std::string(window_key)});
  if (it == rows_.end()) return tl::unexpected(ErrorCode::NotFound);
  return it->second;
}

Expected<std::size_t> MemoryResultStore::erase_unit(std::string_view unit_id,
                                                    std::chrono::milliseconds /*timeout*/) {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  auto it = rows_.lower_bound({std::string(unit_id), std::string()});
  while (it != rows_.end() && it->first.first == unit_id) {
    it = rows_.erase(it);
    ++n;
  }
  return n;
}

std::size_t MemoryResultStore::size() {
  std::lock_guard<std::mutex> lk(mu_);
  return rows_.size();
}
} // namespace aed::store
