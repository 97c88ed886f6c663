#include "mplaunch/config.hpp"
#include "mplaunch/logger.hpp"
#include <fstream>

namespace mplaunch {

using json = nlohmann::json;

void to_json(json &j, const LauncherSettings &s) {
  j = json{{"game_dir", s.gameDir},
           {"repo", s.repo},
           {"product", s.product},
           {"user_agent", s.userAgent},
           {"connect_timeout_secs", s.connectTimeoutSecs},
           {"progress_interval_ms", s.progressIntervalMs},
           {"banner_cooldown_ms", s.bannerCooldownMs}};
}

void from_json(const json &j, LauncherSettings &s) {
  const LauncherSettings defaults;
  s.gameDir = j.value("game_dir", defaults.gameDir);
  s.repo = j.value("repo", defaults.repo);
  s.product = j.value("product", defaults.product);
  s.userAgent = j.value("user_agent", defaults.userAgent);
  s.connectTimeoutSecs =
      j.value("connect_timeout_secs", defaults.connectTimeoutSecs);
  s.progressIntervalMs =
      j.value("progress_interval_ms", defaults.progressIntervalMs);
  s.bannerCooldownMs = j.value("banner_cooldown_ms", defaults.bannerCooldownMs);
}

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;
    settings_ = j.get<LauncherSettings>();
    LOG_INFO("Configuration loaded from " + path.string());
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
  }
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  std::error_code ec;
  if (configPath_.has_parent_path())
    std::filesystem::create_directories(configPath_.parent_path(), ec);

  std::ofstream file(configPath_);
  if (!file) {
    LOG_ERROR("Failed to write config file: " + configPath_.string());
    return;
  }
  file << json(settings_).dump(4);
  LOG_INFO("Configuration saved to " + configPath_.string());
}

} // namespace mplaunch
