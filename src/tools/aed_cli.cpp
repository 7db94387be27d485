#include "aed/audio/normalizer.hpp"
#include "aed/batch/batch.hpp"
#include "aed/batch/units.hpp"
#include "aed/config/config.hpp"
#include "aed/infer/infer.hpp"
#include "aed/model/model.hpp"
#include "aed/persist/json.hpp"
#include "aed/persist/persist.hpp"
#include "aed/shape/shape.hpp"
#include "aed/store/store.hpp"
#include "aed/util/logging.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitModelUnavailable = 2;

void print_usage(const char* prog) {
  std::cerr
    << "Usage: " << prog << " <command> [options]\n"
    << "\nCommands:\n"
    << "  run --device ID --date YYYY-MM-DD   Process the 48 half-hour slots of a day\n"
    << "  run KEY...                          Process the given object keys\n"
    << "  analyze FILE [--shape top_n|timeline|summary]\n"
    << "                                      Classify one local audio file\n"
    << "  diagnose                            Report model cache and load status\n"
    << "\nOptions:\n"
    << "  --threshold X        Detection threshold (default 0.2)\n"
    << "  --segment-seconds S  Summary window length (default 3.0)\n"
    << "  --top-n N            Ranked labels kept (default 20)\n"
    << "  --deadline-ms MS     Stop starting new units after MS milliseconds\n"
    << "  --log-level L        error|warn|info|debug\n"
    << "\nEnvironment: AED_MODEL_CACHE_DIR, AED_MODEL_MIRROR_DIR, AED_AUDIO_ROOT,\n"
    << "  AED_ARTIFACT_ROOT, AED_UPLOAD_ROOT, AED_STATUS_DB, AED_THRESHOLD, ...\n"
    << std::endl;
}

struct CliArgs {
  std::string command;
  std::string device;
  std::string date;
  std::string shape{"top_n"};
  std::vector<std::string> positional;
  std::optional<std::chrono::milliseconds> deadline;
};

// Flags override the environment; false on a malformed or unknown flag.
bool parse_args(int argc, char* argv[], CliArgs& args, aed::config::PipelineConfig& cfg) {
  using aed::config::parse_double;
  using aed::config::parse_int;
  args.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--device" && has_value) {
      args.device = argv[++i];
    } else if (arg == "--date" && has_value) {
      args.date = argv[++i];
    } else if (arg == "--shape" && has_value) {
      args.shape = argv[++i];
    } else if (arg == "--threshold" && has_value) {
      auto v = parse_double(argv[++i]);
      if (!v) return false;
      cfg.shape.threshold = static_cast<float>(*v);
    } else if (arg == "--segment-seconds" && has_value) {
      auto v = parse_double(argv[++i]);
      if (!v) return false;
      cfg.shape.segment_seconds = *v;
    } else if (arg == "--top-n" && has_value) {
      auto v = parse_int(argv[++i]);
      if (!v || *v < 0) return false;
      cfg.shape.top_n = static_cast<std::size_t>(*v);
    } else if (arg == "--deadline-ms" && has_value) {
      auto v = parse_int(argv[++i]);
      if (!v || *v < 0) return false;
      args.deadline = std::chrono::milliseconds(*v);
    } else if (arg == "--log-level" && has_value) {
      auto lvl = aed::parse_log_verbosity(argv[++i]);
      if (!lvl) return false;
      cfg.log_level = *lvl;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    } else {
      args.positional.push_back(arg);
    }
  }
  return true;
}

std::shared_ptr<aed::model::IModelRuntime> make_runtime(const aed::config::PipelineConfig& cfg) {
  auto onnx = cfg.onnx;
  onnx.sample_rate_hz = cfg.normalize.target_rate_hz;
  onnx.frame_window_samples = cfg.framing.window_samples;
  return aed::model::make_onnx_runtime(onnx);
}

std::shared_ptr<aed::model::IModelSource> make_source(const aed::config::PipelineConfig& cfg) {
  if (cfg.model_mirror_dir.empty()) return nullptr;
  return aed::model::make_mirror_model_source(cfg.model_mirror_dir);
}

int cmd_diagnose(const aed::config::PipelineConfig& cfg) {
  using namespace aed;
  const auto& dir = cfg.loader.cache_dir;
  auto valid = model::validate_cache(dir, cfg.loader.layout);

  model::ModelLoader loader(cfg.loader, make_runtime(cfg), make_source(cfg));
  auto handle = loader.acquire();

  persist::JsonWriter w;
  w.begin_object();
  w.key("cache_dir").value(dir.string());
  w.key("cache_complete").value(valid.has_value());
  if (!valid) w.key("cache_error").value(util::error_name(valid.error()));
  w.key("model_loaded").value(handle.has_value());
  w.key("loader_state").value(model::loader_state_name(loader.state()));
  if (handle) {
    w.key("labels").value(static_cast<std::uint64_t>((*handle)->labels().size()));
    w.key("sample_rate_hz").value(static_cast<std::uint64_t>((*handle)->sample_rate_hz()));
  }
  w.end_object();
  std::cout << w.str() << std::endl;
  return handle ? kExitOk : kExitModelUnavailable;
}

int cmd_analyze(const CliArgs& args, const aed::config::PipelineConfig& cfg) {
  using namespace aed;
  if (args.positional.size() != 1) return kExitFailure;

  auto normalizer = audio::make_default_normalizer();
  auto w = normalizer->normalize_file(args.positional.front(), cfg.normalize);
  if (!w) {
    std::cerr << "Error: " << util::error_description(w.error()) << std::endl;
    return kExitFailure;
  }

  model::ModelLoader loader(cfg.loader, make_runtime(cfg), make_source(cfg));
  auto handle = loader.acquire();
  if (!handle) {
    std::cerr << "Error: " << util::error_description(handle.error()) << std::endl;
    return kExitModelUnavailable;
  }

  auto engine = infer::make_default_engine(cfg.framing);
  auto M = engine->infer(*w, **handle);
  if (!M && M.error() == util::ErrorCode::CacheCorrupt) {
    handle = loader.recover(*handle);
    if (!handle) return kExitModelUnavailable;
    M = engine->infer(*w, **handle);
  }
  if (!M) {
    std::cerr << "Error: " << util::error_description(M.error()) << std::endl;
    return kExitFailure;
  }

  if (args.shape == "top_n") {
    std::cout << persist::top_n_json(shape::top_n(*M, cfg.shape.top_n, cfg.shape.aggregation)) << std::endl;
  } else if (args.shape == "timeline") {
    std::cout << persist::timeline_json(shape::timeline(*M, cfg.shape.threshold)) << std::endl;
  } else if (args.shape == "summary") {
    auto s = shape::segment_summary(*M, cfg.shape.threshold, cfg.shape.segment_seconds);
    if (!s) {
      std::cerr << "Error: " << util::error_description(s.error()) << std::endl;
      return kExitFailure;
    }
    std::cout << persist::summary_json(*s) << std::endl;
  } else {
    std::cerr << "Unknown shape: " << args.shape << std::endl;
    return kExitFailure;
  }
  return kExitOk;
}

int cmd_run(const CliArgs& args, const aed::config::PipelineConfig& cfg) {
  using namespace aed;
  const bool device_day = !args.device.empty() || !args.date.empty();
  std::vector<batch::AudioUnit> units;
  if (device_day) {
    auto expanded = batch::expand_device_day(args.device, args.date);
    if (!expanded) {
      std::cerr << "Error: invalid device or date" << std::endl;
      return kExitFailure;
    }
    units = std::move(*expanded);
  } else {
    for (const auto& key : args.positional) units.push_back(batch::make_unit(key));
  }
  if (units.empty() || cfg.audio_root.empty()) {
    std::cerr << "Error: no units, or AED_AUDIO_ROOT unset" << std::endl;
    return kExitFailure;
  }

  std::shared_ptr<store::IStatusStore> status;
  std::shared_ptr<store::IResultStore> results;
  if (!cfg.status_db.empty()) {
    auto env = store::open_lmdb(cfg.status_db, cfg.lmdb);
    if (!env) {
      std::cerr << "Error: status db: " << util::error_description(env.error()) << std::endl;
      return kExitFailure;
    }
    status = store::make_lmdb_status_store(*env);
    results = store::make_lmdb_result_store(*env);
  } else {
    status = std::make_shared<store::MemoryStatusStore>();
  }
  std::shared_ptr<persist::IArtifactUploader> uploader;
  if (!cfg.upload_root.empty()) uploader = persist::make_directory_uploader(cfg.upload_root);

  model::ModelLoader loader(cfg.loader, make_runtime(cfg), make_source(cfg));
  auto normalizer = audio::make_default_normalizer();
  auto engine = infer::make_default_engine(cfg.framing);
  auto source = store::make_directory_audio_source(cfg.audio_root);
  persist::PersistenceAdapter persistence(cfg.persist, status, results, uploader);

  batch::RunOptions opts;
  opts.shape = cfg.shape;
  opts.normalize = cfg.normalize;
  opts.fetch = cfg.fetch;
  if (args.deadline) opts.deadline = util::Deadline::after(*args.deadline);

  batch::BatchOrchestrator orchestrator(loader, *normalizer, *engine, *source, persistence);
  auto report = orchestrator.run(units, opts);
  if (!report) {
    std::cerr << "Error: " << util::error_description(report.error()) << std::endl;
    return report.error() == util::ErrorCode::ModelUnavailable ? kExitModelUnavailable : kExitFailure;
  }

  if (device_day && !cfg.persist.artifact_root.empty()) {
    auto written = persistence.write_batch_summary(args.device, args.date, units.size(),
                                                   batch::processed_slots(*report, units));
    if (!written) {
      AED_LOG_WARN("processing summary not written: " << util::error_name(written.error()));
    }
  }

  std::cout << batch::report_to_json(*report) << std::endl;
  return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return kExitFailure;
  }

  try {
    auto cfg = aed::config::load_from_env();
    if (!cfg) {
      std::cerr << "Error: malformed AED_* environment variable" << std::endl;
      return kExitFailure;
    }
    CliArgs args;
    if (!parse_args(argc, argv, args, *cfg)) {
      print_usage(argv[0]);
      return kExitFailure;
    }
    if (auto ok = aed::config::validate(*cfg); !ok) {
      std::cerr << "Error: " << aed::util::error_description(ok.error()) << std::endl;
      return kExitFailure;
    }
    aed::set_log_verbosity(cfg->log_level);

    if (args.command == "run") return cmd_run(args, *cfg);
    if (args.command == "analyze") return cmd_analyze(args, *cfg);
    if (args.command == "diagnose") return cmd_diagnose(*cfg);

    std::cerr << "Unknown command: " << args.command << std::endl;
    print_usage(argv[0]);
    return kExitFailure;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
}
