#include "mplaunch/path_manager.hpp"
#include "mplaunch/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace mplaunch {

PathManager &PathManager::instance() {
  static PathManager instance;
  return instance;
}

void PathManager::init(const std::string &configOverride) {
  configDir_ = resolveConfigRoot(configOverride);
  dataDir_ = resolveDataRoot();
  logsDir_ = configDir_ / "logs";

  std::filesystem::create_directories(configDir_);
  std::filesystem::create_directories(logsDir_);

  auto now = std::chrono::system_clock::now();
  auto in_time_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&in_time_t, &tm);
  std::stringstream ss;
  ss << "mplaunch_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
  currentLogPath_ = logsDir_ / ss.str();
}

void PathManager::setGameDir(const std::string &gameDir) {
  gameDir_ = gameDir.empty() ? defaultGameDir()
                             : std::filesystem::absolute(gameDir);
  std::filesystem::create_directories(gameDir_);
  std::filesystem::create_directories(versions());
  LOG_DEBUG("Game directory: " + gameDir_.string());
}

std::filesystem::path
PathManager::resolveConfigRoot(const std::string &override) {
  if (!override.empty())
    return std::filesystem::absolute(override);

  const char *envPath = std::getenv("MPLAUNCH_PATH");
  if (envPath && strlen(envPath) > 0)
    return std::filesystem::absolute(envPath);

  const char *xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
  if (xdgConfigHome && strlen(xdgConfigHome) > 0)
    return std::filesystem::absolute(xdgConfigHome) / "mineplace3d-launcher";

  const char *home = std::getenv("HOME");
  if (!home)
    home = ".";
  return std::filesystem::path(home) / ".config" / "mineplace3d-launcher";
}

std::filesystem::path PathManager::resolveDataRoot() {
  const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
  if (xdgDataHome && strlen(xdgDataHome) > 0)
    return std::filesystem::absolute(xdgDataHome);

  const char *home = std::getenv("HOME");
  if (!home)
    home = ".";
  return std::filesystem::path(home) / ".local" / "share";
}

} // namespace mplaunch
