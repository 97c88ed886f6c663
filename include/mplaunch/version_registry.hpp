#ifndef MPLAUNCH_VERSION_REGISTRY_HPP
#define MPLAUNCH_VERSION_REGISTRY_HPP

#include "mplaunch/version.hpp"
#include <filesystem>
#include <unordered_set>
#include <vector>

namespace mplaunch {

// The set of installed builds, persisted as a JSON array of version strings
// in <game_dir>/versions/versions.json.
class VersionRegistry {
public:
  explicit VersionRegistry(const std::filesystem::path &file);

  // A missing file yields an empty set; entries that do not parse are skipped.
  // Throws Error(IO) when the file exists but is not a JSON array.
  void load();
  // Throws Error(IO) when the file cannot be written.
  void save() const;

  bool contains(const Version &version) const;
  // Returns false if it was already present.
  bool insert(const Version &version);

  // Newest first.
  std::vector<Version> sortedDescending() const;
  size_t size() const { return versions_.size(); }

private:
  std::filesystem::path file_;
  std::unordered_set<Version> versions_;
};

} // namespace mplaunch

#endif // MPLAUNCH_VERSION_REGISTRY_HPP
