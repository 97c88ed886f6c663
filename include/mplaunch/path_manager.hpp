#ifndef MPLAUNCH_PATH_MANAGER_HPP
#define MPLAUNCH_PATH_MANAGER_HPP

#include <filesystem>
#include <string>

namespace mplaunch {

class PathManager {
public:
  static PathManager &instance();

  // Resolves the launcher's own directories. The config root honours
  // MPLAUNCH_PATH, then XDG_CONFIG_HOME, then ~/.config.
  void init(const std::string &configOverride = "");

  // Points the manager at a game directory (empty = the default one) and
  // creates <game_dir> and <game_dir>/versions.
  void setGameDir(const std::string &gameDir);

  std::filesystem::path configFile() const {
    return configDir_ / "launcher_settings.json";
  }
  std::filesystem::path dataDir() const { return dataDir_; }
  std::filesystem::path logs() const { return logsDir_; }
  std::filesystem::path currentLog() const { return currentLogPath_; }

  std::filesystem::path gameDir() const { return gameDir_; }
  std::filesystem::path versions() const { return gameDir_ / "versions"; }
  std::filesystem::path versionsFile() const {
    return versions() / "versions.json";
  }

  std::filesystem::path defaultGameDir() const {
    return dataDir_ / "mineplace3d";
  }

private:
  PathManager() = default;

  std::filesystem::path configDir_;
  std::filesystem::path dataDir_;
  std::filesystem::path logsDir_;
  std::filesystem::path currentLogPath_;
  std::filesystem::path gameDir_;

  static std::filesystem::path resolveConfigRoot(const std::string &override);
  static std::filesystem::path resolveDataRoot();
};

} // namespace mplaunch

#endif // MPLAUNCH_PATH_MANAGER_HPP
