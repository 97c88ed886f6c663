#ifndef MPLAUNCH_CONFIG_HPP
#define MPLAUNCH_CONFIG_HPP

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace mplaunch {

struct LauncherSettings {
  std::string gameDir;                         // empty = <data_dir>/mineplace3d
  std::string repo = "Muhtasim-Rasheed/mineplace3d"; // GitHub "user/repo"
  std::string product = "mineplace3d";         // asset name prefix
  std::string userAgent = "mineplace3d-launcher";
  long connectTimeoutSecs = 30;
  int progressIntervalMs = 250;
  int bannerCooldownMs = 3000;
};

void to_json(nlohmann::json &j, const LauncherSettings &s);
void from_json(const nlohmann::json &j, LauncherSettings &s);

class Config {
public:
  static Config &instance();

  // Missing file: defaults are written back. Malformed file: logged and the
  // defaults are kept.
  void load(const std::filesystem::path &configPath);
  void save();

  LauncherSettings &getSettings() { return settings_; }
  std::filesystem::path path() const { return configPath_; }

  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  LauncherSettings settings_;

  std::recursive_mutex mutex_;
};

} // namespace mplaunch

#endif // MPLAUNCH_CONFIG_HPP
