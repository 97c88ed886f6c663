#include "mplaunch/asset_resolver.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/logger.hpp"
#include <nlohmann/json.hpp>

namespace mplaunch {

const std::string AssetResolver::API_BASE = "https://api.github.com/repos/";

AssetResolver::AssetResolver(const std::string &repo,
                             const std::string &product, const Target &target)
    : repo_(repo), product_(product), target_(target) {}

std::string AssetResolver::releaseTag(const Version &version) {
  return "v" + version.render();
}

std::string AssetResolver::metadataUrl(const Version &version) const {
  return API_BASE + repo_ + "/releases/tags/" + releaseTag(version);
}

std::string AssetResolver::assetName() const {
  return product_ + "-" + target_.platformToken() + "-" +
         target_.archToken() + target_.binarySuffix();
}

std::filesystem::path
AssetResolver::binaryPath(const std::filesystem::path &versionsDir,
                          const Version &version) const {
  return versionsDir / (version.render() + target_.binarySuffix());
}

std::string AssetResolver::findAssetUrl(const std::string &metadataBody,
                                        const Version &version) const {
  const std::string tag = releaseTag(version);
  const std::string wanted = assetName();

  nlohmann::json release;
  try {
    release = nlohmann::json::parse(metadataBody);
  } catch (const nlohmann::json::parse_error &e) {
    throw Error(ErrorKind::RESOLUTION,
                "No suitable asset found for version " + tag +
                    ": malformed release metadata (" + e.what() + ")");
  }

  if (!release.is_object() || !release.contains("assets") ||
      !release["assets"].is_array()) {
    throw Error(ErrorKind::RESOLUTION,
                "No suitable asset found for version " + tag +
                    ": release has no assets");
  }

  for (const auto &asset : release["assets"]) {
    if (!asset.is_object() || !asset.contains("name") ||
        !asset["name"].is_string())
      continue;
    if (asset["name"].get<std::string>() != wanted)
      continue;

    if (!asset.contains("browser_download_url") ||
        !asset["browser_download_url"].is_string()) {
      throw Error(ErrorKind::RESOLUTION,
                  "Invalid asset download URL for version " + tag);
    }
    LOG_DEBUG("Matched asset " + wanted + " for " + tag);
    return asset["browser_download_url"].get<std::string>();
  }

  throw Error(ErrorKind::RESOLUTION, "No suitable asset found for version " +
                                         tag + " (expected " + wanted + ")");
}

} // namespace mplaunch
