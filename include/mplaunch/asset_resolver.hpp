#ifndef MPLAUNCH_ASSET_RESOLVER_HPP
#define MPLAUNCH_ASSET_RESOLVER_HPP

#include "mplaunch/platform.hpp"
#include "mplaunch/version.hpp"
#include <filesystem>
#include <string>

namespace mplaunch {

class AssetResolver {
public:
  // repo is GitHub "user/repo", product prefixes every asset name
  AssetResolver(const std::string &repo, const std::string &product,
                const Target &target);

  static std::string releaseTag(const Version &version);
  std::string metadataUrl(const Version &version) const;

  // <product>-<platform>-<arch><suffix>, "unknown" for unrecognised parts
  std::string assetName() const;

  // Where the installed build lives inside <game_dir>/versions
  std::filesystem::path binaryPath(const std::filesystem::path &versionsDir,
                                   const Version &version) const;

  // Scans the release metadata for an asset named exactly assetName() and
  // returns its browser_download_url. Throws Error(RESOLUTION) when the body
  // is not JSON, has no assets array, has no match or the match has no URL.
  std::string findAssetUrl(const std::string &metadataBody,
                           const Version &version) const;

  const Target &target() const { return target_; }

  static const std::string API_BASE;

private:
  std::string repo_;
  std::string product_;
  Target target_;
};

} // namespace mplaunch

#endif // MPLAUNCH_ASSET_RESOLVER_HPP
