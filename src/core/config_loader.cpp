#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace rwc {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static std::vector<std::string> GetStringList(const YAML::Node& parent, const char* key, const std::string& key_path, const std::vector<std::string>& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  if (!n.IsSequence()) throw ConfigError(key_path, "expected a list of strings");

  std::vector<std::string> out;
  for (std::size_t i = 0; i < n.size(); ++i) {
    try {
      out.push_back(n[i].as<std::string>());
    } catch (const YAML::Exception& e) {
      throw ConfigError(key_path + "[" + std::to_string(i) + "]", e.what());
    }
  }
  return out;
}

static DropPolicy ParseDropPolicyKey(const YAML::Node& parent, const char* key, const std::string& key_path, DropPolicy fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "drop_oldest") return DropPolicy::DropOldest;
  if (s == "drop_newest") return DropPolicy::DropNewest;
  throw ConfigError(key_path, "unknown drop_policy '" + s + "'. Use: drop_oldest | drop_newest");
}

static void LoadQueueConfig(const YAML::Node& qnode, const std::string& key_path, QueueConfig& out) {
  if (!qnode) return;
  out.capacity = GetOrKey<std::size_t>(qnode, "capacity", PathJoin(key_path, "capacity"), out.capacity);
  out.drop_policy = ParseDropPolicyKey(qnode, "drop_policy", PathJoin(key_path, "drop_policy"), out.drop_policy);
}

static void LoadCapture(const YAML::Node& root, CaptureConfig& cfg) {
  const YAML::Node cap = root["capture"];
  if (!cap) return;
  const std::string p = "capture";

  cfg.interval_ms = GetOrKey<int>(cap, "interval_ms", PathJoin(p, "interval_ms"), cfg.interval_ms);
  cfg.deduplication_enabled = GetOrKey<bool>(cap, "deduplication_enabled", PathJoin(p, "deduplication_enabled"), cfg.deduplication_enabled);
  cfg.deduplication_threshold = GetOrKey<double>(cap, "deduplication_threshold", PathJoin(p, "deduplication_threshold"), cfg.deduplication_threshold);

  const YAML::Node res = cap["max_resolution"];
  const std::string rp = PathJoin(p, "max_resolution");
  if (res) {
    cfg.max_resolution.width = GetOrKey<int>(res, "width", PathJoin(rp, "width"), cfg.max_resolution.width);
    cfg.max_resolution.height = GetOrKey<int>(res, "height", PathJoin(rp, "height"), cfg.max_resolution.height);
  }

  cfg.excluded_apps = GetStringList(cap, "excluded_apps", PathJoin(p, "excluded_apps"), cfg.excluded_apps);
  cfg.exclude_private_windows = GetOrKey<bool>(cap, "exclude_private_windows", PathJoin(p, "exclude_private_windows"), cfg.exclude_private_windows);
  cfg.custom_private_window_patterns = GetStringList(cap, "custom_private_window_patterns", PathJoin(p, "custom_private_window_patterns"), cfg.custom_private_window_patterns);

  cfg.capture_on_window_change = GetOrKey<bool>(cap, "capture_on_window_change", PathJoin(p, "capture_on_window_change"), cfg.capture_on_window_change);
  cfg.record_all_displays = GetOrKey<bool>(cap, "record_all_displays", PathJoin(p, "record_all_displays"), cfg.record_all_displays);
  cfg.capture_browser_url = GetOrKey<bool>(cap, "capture_browser_url", PathJoin(p, "capture_browser_url"), cfg.capture_browser_url);
}

static void LoadTuning(const YAML::Node& root, TuningConfig& cfg) {
  const YAML::Node t = root["tuning"];
  if (!t) return;
  const std::string p = "tuning";

  cfg.cycle_window_ms = GetOrKey<int>(t, "cycle_window_ms", PathJoin(p, "cycle_window_ms"), cfg.cycle_window_ms);
  cfg.metadata_cache_ttl_ms = GetOrKey<int>(t, "metadata_cache_ttl_ms", PathJoin(p, "metadata_cache_ttl_ms"), cfg.metadata_cache_ttl_ms);
  cfg.window_change_debounce_ms = GetOrKey<int>(t, "window_change_debounce_ms", PathJoin(p, "window_change_debounce_ms"), cfg.window_change_debounce_ms);
  cfg.settle_delay_ms = GetOrKey<int>(t, "settle_delay_ms", PathJoin(p, "settle_delay_ms"), cfg.settle_delay_ms);
  cfg.settle_poll_ms = GetOrKey<int>(t, "settle_poll_ms", PathJoin(p, "settle_poll_ms"), cfg.settle_poll_ms);
  cfg.settle_timeout_ms = GetOrKey<int>(t, "settle_timeout_ms", PathJoin(p, "settle_timeout_ms"), cfg.settle_timeout_ms);
  cfg.min_window_width = GetOrKey<int>(t, "min_window_width", PathJoin(p, "min_window_width"), cfg.min_window_width);
  cfg.min_window_height = GetOrKey<int>(t, "min_window_height", PathJoin(p, "min_window_height"), cfg.min_window_height);
  cfg.min_window_alpha = GetOrKey<double>(t, "min_window_alpha", PathJoin(p, "min_window_alpha"), cfg.min_window_alpha);
}

static void LoadBuffering(const YAML::Node& root, BufferingConfig& cfg) {
  const YAML::Node buf = root["buffering"];
  if (!buf) return;
  const std::string p = "buffering";

  LoadQueueConfig(buf["raw_frames"], PathJoin(p, "raw_frames"), cfg.raw_frames);
  LoadQueueConfig(buf["output_frames"], PathJoin(p, "output_frames"), cfg.output_frames);
}

static void LoadLogging(const YAML::Node& root, LoggingConfig& cfg) {
  const YAML::Node l = root["logging"];
  if (!l) return;
  const std::string p = "logging";

  cfg.level = GetOrKey<std::string>(l, "level", PathJoin(p, "level"), cfg.level);
  cfg.pattern = GetOrKey<std::string>(l, "pattern", PathJoin(p, "pattern"), cfg.pattern);
  cfg.file_path = GetOrKey<std::string>(l, "file_path", PathJoin(p, "file_path"), cfg.file_path);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = root["metrics"];
  if (!m) return;
  const std::string p = "metrics";

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);
}

static void LoadReplayDisplay(const YAML::Node& d, const std::string& dp, ReplayDisplayConfig& out) {
  out.runtime_id = GetOrKey<std::uint32_t>(d, "runtime_id", PathJoin(dp, "runtime_id"), out.runtime_id);
  out.name = GetOrKey<std::string>(d, "name", PathJoin(dp, "name"), out.name);
  out.x = GetOrKey<int>(d, "x", PathJoin(dp, "x"), out.x);
  out.y = GetOrKey<int>(d, "y", PathJoin(dp, "y"), out.y);
  out.width = GetOrKey<int>(d, "width", PathJoin(dp, "width"), out.width);
  out.height = GetOrKey<int>(d, "height", PathJoin(dp, "height"), out.height);
  out.is_main = GetOrKey<bool>(d, "is_main", PathJoin(dp, "is_main"), out.is_main);
  out.vendor = GetOrKey<std::uint32_t>(d, "vendor", PathJoin(dp, "vendor"), out.vendor);
  out.model = GetOrKey<std::uint32_t>(d, "model", PathJoin(dp, "model"), out.model);
  out.serial = GetOrKey<std::uint32_t>(d, "serial", PathJoin(dp, "serial"), out.serial);
  out.image_dir = GetOrKey<std::string>(d, "image_dir", PathJoin(dp, "image_dir"), out.image_dir);
}

static void LoadReplay(const YAML::Node& root, ReplayConfig& cfg) {
  const YAML::Node r = root["replay"];
  if (!r) return;
  const std::string p = "replay";

  cfg.has_capture_permission = GetOrKey<bool>(r, "has_capture_permission", PathJoin(p, "has_capture_permission"), cfg.has_capture_permission);

  const YAML::Node displays = r["displays"];
  const std::string dp = PathJoin(p, "displays");
  if (displays) {
    if (!displays.IsSequence()) throw ConfigError(dp, "expected a list of displays");
    cfg.displays.clear();
    for (std::size_t i = 0; i < displays.size(); ++i) {
      ReplayDisplayConfig d;
      d.runtime_id = static_cast<std::uint32_t>(i + 1);
      LoadReplayDisplay(displays[i], dp + "[" + std::to_string(i) + "]", d);
      cfg.displays.push_back(d);
    }
  }

  const YAML::Node app = r["frontmost"];
  const std::string ap = PathJoin(p, "frontmost");
  if (app) {
    cfg.frontmost.bundle_id = GetOrKey<std::string>(app, "bundle_id", PathJoin(ap, "bundle_id"), cfg.frontmost.bundle_id);
    cfg.frontmost.app_name = GetOrKey<std::string>(app, "app_name", PathJoin(ap, "app_name"), cfg.frontmost.app_name);
    cfg.frontmost.window_title = GetOrKey<std::string>(app, "window_title", PathJoin(ap, "window_title"), cfg.frontmost.window_title);
    cfg.frontmost.browser_url = GetOrKey<std::string>(app, "browser_url", PathJoin(ap, "browser_url"), cfg.frontmost.browser_url);
  }
}

static void LoadDaemon(const YAML::Node& root, DaemonConfig& cfg) {
  const YAML::Node d = root["daemon"];
  if (!d) return;
  const std::string p = "daemon";

  cfg.max_runtime_s = GetOrKey<int>(d, "max_runtime_s", PathJoin(p, "max_runtime_s"), cfg.max_runtime_s);
  cfg.output_dir = GetOrKey<std::string>(d, "output_dir", PathJoin(p, "output_dir"), cfg.output_dir);
}

void ValidateCaptureConfig(const CaptureConfig& cfg) {
  if (cfg.interval_ms <= 0) throw ConfigError("capture.interval_ms", "must be > 0");
  if (cfg.deduplication_threshold < 0.0 || cfg.deduplication_threshold > 1.0)
    throw ConfigError("capture.deduplication_threshold", "must be in [0, 1]");
  if (cfg.max_resolution.width <= 0 || cfg.max_resolution.height <= 0)
    throw ConfigError("capture.max_resolution", "width/height must be > 0");
  for (const auto& app : cfg.excluded_apps) {
    if (app.empty()) throw ConfigError("capture.excluded_apps", "entries must not be empty");
  }
}

void ValidateOrThrow(const AppConfig& cfg) {
  ValidateCaptureConfig(cfg.capture);

  const auto& t = cfg.tuning;
  if (t.cycle_window_ms <= 0) throw ConfigError("tuning.cycle_window_ms", "must be > 0");
  if (t.metadata_cache_ttl_ms < 0) throw ConfigError("tuning.metadata_cache_ttl_ms", "must be >= 0");
  if (t.window_change_debounce_ms < 0) throw ConfigError("tuning.window_change_debounce_ms", "must be >= 0");
  if (t.settle_delay_ms < 0) throw ConfigError("tuning.settle_delay_ms", "must be >= 0");
  if (t.settle_poll_ms <= 0) throw ConfigError("tuning.settle_poll_ms", "must be > 0");
  if (t.settle_timeout_ms < t.settle_poll_ms)
    throw ConfigError("tuning.settle_timeout_ms", "must be >= tuning.settle_poll_ms");
  if (t.min_window_width < 0 || t.min_window_height < 0)
    throw ConfigError("tuning", "min_window_width/min_window_height must be >= 0");
  if (t.min_window_alpha < 0.0 || t.min_window_alpha > 1.0)
    throw ConfigError("tuning.min_window_alpha", "must be in [0, 1]");

  if (cfg.buffering.raw_frames.capacity < 1)
    throw ConfigError("buffering.raw_frames.capacity", "must be >= 1");
  if (cfg.buffering.output_frames.capacity < 1)
    throw ConfigError("buffering.output_frames.capacity", "must be >= 1");

  static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  bool known_level = false;
  for (const char* l : kLevels) known_level = known_level || cfg.logging.level == l;
  if (!known_level) throw ConfigError("logging.level", "unknown level '" + cfg.logging.level + "'");

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");

  for (std::size_t i = 0; i < cfg.replay.displays.size(); ++i) {
    const auto& d = cfg.replay.displays[i];
    const std::string dp = "replay.displays[" + std::to_string(i) + "]";
    if (d.runtime_id == 0) throw ConfigError(dp + ".runtime_id", "must be != 0");
    if (d.width <= 0 || d.height <= 0) throw ConfigError(dp, "width/height must be > 0");
    for (std::size_t j = 0; j < i; ++j) {
      if (cfg.replay.displays[j].runtime_id == d.runtime_id)
        throw ConfigError(dp + ".runtime_id", "duplicate runtime_id " + std::to_string(d.runtime_id));
    }
  }

  if (cfg.daemon.max_runtime_s < 0) throw ConfigError("daemon.max_runtime_s", "must be >= 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadCapture(root, cfg.capture);
  LoadTuning(root, cfg.tuning);
  LoadBuffering(root, cfg.buffering);
  LoadLogging(root, cfg.logging);
  LoadMetrics(root, cfg.metrics);
  LoadReplay(root, cfg.replay);
  LoadDaemon(root, cfg.daemon);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace rwc
