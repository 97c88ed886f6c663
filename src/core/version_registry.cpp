#include "mplaunch/version_registry.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/logger.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mplaunch {

VersionRegistry::VersionRegistry(const std::filesystem::path &file)
    : file_(file) {}

void VersionRegistry::load() {
  versions_.clear();
  if (!std::filesystem::exists(file_)) {
    LOG_DEBUG("No version registry at " + file_.string());
    return;
  }

  nlohmann::json j;
  try {
    std::ifstream ifs(file_);
    ifs >> j;
  } catch (const nlohmann::json::exception &e) {
    throw Error(ErrorKind::IO, "Failed to parse versions data in " +
                                   file_.string() + ": " + e.what());
  }
  if (!j.is_array()) {
    throw Error(ErrorKind::IO,
                "Versions data in " + file_.string() + " is not a list");
  }

  for (const auto &entry : j) {
    if (!entry.is_string()) {
      LOG_WARN("Skipping non-string entry in " + file_.string());
      continue;
    }
    try {
      versions_.insert(Version::parse(entry.get<std::string>()));
    } catch (const Error &e) {
      LOG_WARN("Skipping unreadable version entry: " + std::string(e.what()));
    }
  }
  LOG_INFO("Loaded " + std::to_string(versions_.size()) +
           " installed versions");
}

void VersionRegistry::save() const {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &v : sortedDescending())
    j.push_back(v.render());

  std::error_code ec;
  if (file_.has_parent_path())
    std::filesystem::create_directories(file_.parent_path(), ec);

  std::ofstream ofs(file_, std::ios::trunc);
  ofs << j.dump(2);
  ofs.close();
  if (!ofs)
    throw Error(ErrorKind::IO, "Failed to write versions file " +
                                   file_.string());
}

bool VersionRegistry::contains(const Version &version) const {
  return versions_.count(version) > 0;
}

bool VersionRegistry::insert(const Version &version) {
  return versions_.insert(version).second;
}

std::vector<Version> VersionRegistry::sortedDescending() const {
  std::vector<Version> sorted(versions_.begin(), versions_.end());
  std::sort(sorted.begin(), sorted.end(), std::greater<Version>());
  return sorted;
}

} // namespace mplaunch
