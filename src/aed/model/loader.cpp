#include "aed/model/model.hpp"

#include <thread>
#include <utility>
#include <vector>

#include "aed/util/logging.hpp"

namespace aed::model {
using aed::util::ErrorCode;
using aed::util::Expected;

std::string_view loader_state_name(LoaderState s) noexcept {
  switch (s) {
    case LoaderState::Unloaded:
      return "Unloaded";
    case LoaderState::Validating:
      return "Validating";
    case LoaderState::Loaded:
      return "Loaded";
    case LoaderState::Recovering:
      return "Recovering";
  }
  return "Unknown";
}

ModelLoader::ModelLoader(LoaderOptions options,
                         std::shared_ptr<IModelRuntime> runtime,
                         std::shared_ptr<IModelSource> source)
  : options_(std::move(options)), runtime_(std::move(runtime)), source_(std::move(source)) {
  if (options_.max_attempts == 0) options_.max_attempts = 1;
}

void ModelLoader::set_state(LoaderState s) {
  const auto prev = state_.exchange(s);
  if (prev != s) {
    AED_LOG_DEBUG("model loader " << loader_state_name(prev) << " -> " << loader_state_name(s));
  }
}

Expected<ModelHandlePtr> ModelLoader::acquire() {
  std::lock_guard<std::mutex> lk(mu_);
  if (current_) return current_;
  return load_locked(false);
}

Expected<ModelHandlePtr> ModelLoader::recover(const ModelHandlePtr& failed) {
  std::lock_guard<std::mutex> lk(mu_);
  if (current_ && current_ != failed) {
    AED_LOG_DEBUG("model already replaced (generation " << current_->generation() << ")");
    return current_;
  }

  AED_LOG_WARN("model cache reported corrupt during inference, recovering");
  current_.reset();
  set_state(LoaderState::Recovering);
  auto h = load_locked(true);
  if (h) recoveries_.fetch_add(1);
  return h;
}

void ModelLoader::invalidate() {
  std::lock_guard<std::mutex> lk(mu_);
  current_.reset();
  set_state(LoaderState::Unloaded);
}

Expected<ModelHandlePtr> ModelLoader::load_locked(bool purge_first) {
  if (!runtime_) return tl::unexpected(ErrorCode::ModelUnavailable);

  bool purge = purge_first;
  for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    Expected<ModelHandlePtr> h = tl::unexpected(ErrorCode::Internal);
    if (purge) AED_LOG_INFO("deleting model cache " << options_.cache_dir.string());
    if (auto rm = purge ? remove_cache(options_.cache_dir) : Expected<void>{}; !rm)
      h = tl::unexpected(rm.error());
    else
      h = attempt_locked();
    if (h) {
      current_ = *h;
      set_state(LoaderState::Loaded);
      AED_LOG_INFO("model loaded (generation " << current_->generation() << ", "
                   << current_->labels().size() << " labels)");
      return current_;
    }

    AED_LOG_WARN("model load attempt " << attempt << "/" << options_.max_attempts
                 << " failed: " << util::error_name(h.error()));
    set_state(LoaderState::Recovering);
    purge = true;
    if (attempt < options_.max_attempts && options_.retry_delay.count() > 0)
      std::this_thread::sleep_for(options_.retry_delay);
  }

  // Do not leave a half-written cache behind for the next run.
  if (auto rm = remove_cache(options_.cache_dir); !rm)
    AED_LOG_WARN("could not delete model cache " << options_.cache_dir.string());
  set_state(LoaderState::Unloaded);
  AED_LOG_ERROR("model unavailable after " << options_.max_attempts << " attempts");
  return tl::unexpected(ErrorCode::ModelUnavailable);
}

Expected<ModelHandlePtr> ModelLoader::attempt_locked() {
  const auto& dir = options_.cache_dir;
  set_state(LoaderState::Validating);

  auto valid = validate_cache(dir, options_.layout);
  if (!valid) {
    if (valid.error() == ErrorCode::CacheCorrupt) {
      AED_LOG_WARN("model cache " << dir.string() << " is incomplete, deleting");
      set_state(LoaderState::Recovering);
      if (auto rm = remove_cache(dir); !rm) return tl::unexpected(rm.error());
    }
    if (!source_) return tl::unexpected(ErrorCode::Unavailable);

    AED_LOG_INFO("fetching model into " << dir.string());
    if (auto f = source_->fetch_into(dir, options_.layout); !f) return tl::unexpected(f.error());
    if (auto v = validate_cache(dir, options_.layout); !v) return tl::unexpected(ErrorCode::CacheCorrupt);
  }

  auto handle = runtime_->open(dir, options_.layout, ++generation_);
  if (!handle) return tl::unexpected(handle.error());
  const auto& h = *handle;

  if (options_.expected_labels != 0 && h->labels().size() != options_.expected_labels) {
    AED_LOG_WARN("class map has " << h->labels().size() << " labels, expected "
                 << options_.expected_labels);
    return tl::unexpected(ErrorCode::CacheCorrupt);
  }

  if (options_.warm_up) {
    std::vector<float> silence(h->frame_window_samples(), 0.0f);
    auto scores = h->classify(silence, 1);
    if (!scores) return tl::unexpected(scores.error());
    if (scores->size() != h->labels().size()) return tl::unexpected(ErrorCode::CacheCorrupt);
  }
  return handle;
}
} // namespace aed::model
