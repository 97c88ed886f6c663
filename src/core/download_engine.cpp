#include "mplaunch/download_engine.hpp"
#include "mplaunch/dependency_installer.hpp"
#include "mplaunch/logger.hpp"
#include <stdexcept>

namespace mplaunch {

std::string downloadStageName(DownloadStage stage) {
  switch (stage) {
  case DownloadStage::IDLE:
    return "Idle";
  case DownloadStage::FETCHING_METADATA:
    return "Fetching metadata";
  case DownloadStage::RESOLVING_ASSET:
    return "Resolving asset";
  case DownloadStage::STREAMING:
    return "Streaming";
  case DownloadStage::INSTALLING_DEPENDENCY:
    return "Installing dependency";
  case DownloadStage::FINALIZING:
    return "Finalizing";
  case DownloadStage::SUCCEEDED:
    return "Succeeded";
  case DownloadStage::FAILED:
    return "Failed";
  default:
    return "Unknown";
  }
}

DownloadEngine::DownloadEngine(HttpClient &http, const AssetResolver &resolver,
                               const std::filesystem::path &gameDir)
    : http_(http), resolver_(resolver), gameDir_(gameDir), streamer_(http) {}

void DownloadEngine::setProgressInterval(std::chrono::milliseconds interval) {
  streamer_.setInterval(interval);
}

void DownloadEngine::setClock(SteadyClock clock) {
  streamer_.setClock(std::move(clock));
}

void DownloadEngine::enter(DownloadStage stage, const Version &version) {
  LOG_DEBUG("[v" + version.render() + "] " + downloadStageName(stage));
  if (stageCallback_)
    stageCallback_(stage);
}

std::string DownloadEngine::fetchMetadata(const Version &version) {
  const std::string tag = AssetResolver::releaseTag(version);
  const std::string url = resolver_.metadataUrl(version);

  HttpResponse response;
  try {
    response = http_.get(url);
  } catch (const Error &e) {
    throw Error(ErrorKind::TRANSPORT, "Failed to fetch release info for " +
                                          tag + ": " + e.what());
  }

  if (!response.ok()) {
    throw Error(ErrorKind::STATUS, "Release for version " + tag +
                                       " not found (HTTP " +
                                       std::to_string(response.status) + ")");
  }
  return response.body;
}

void DownloadEngine::finalize(const std::filesystem::path &binary,
                              const Version &version) {
  if (!resolver_.target().isPosix())
    return;

  using std::filesystem::perms;
  std::error_code ec;
  std::filesystem::permissions(binary,
                               perms::owner_all | perms::group_read |
                                   perms::group_exec | perms::others_read |
                                   perms::others_exec,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw Error(ErrorKind::IO, "Failed to set permissions for " +
                                   binary.string() + " (v" + version.render() +
                                   "): " + ec.message());
  }
}

Version DownloadEngine::install(const Version &version) {
  if (!sender_.connected())
    throw std::logic_error("sender not set");

  const std::string tag = AssetResolver::releaseTag(version);
  LOG_INFO("Installing " + tag + " for " + resolver_.target().describe());

  enter(DownloadStage::FETCHING_METADATA, version);
  std::string metadata = fetchMetadata(version);

  enter(DownloadStage::RESOLVING_ASSET, version);
  std::string assetUrl = resolver_.findAssetUrl(metadata, version);

  enter(DownloadStage::STREAMING, version);
  std::error_code ec;
  std::filesystem::create_directories(versionsDir(), ec);
  if (ec) {
    throw Error(ErrorKind::IO, "Failed to create " + versionsDir().string() +
                                   ": " + ec.message());
  }
  const auto binary = resolver_.binaryPath(versionsDir(), version);
  LOG_INFO("Writing executable to " + binary.string());
  streamer_.download(assetUrl, binary, "asset for version " + tag, &sender_);

  DependencyInstaller deps(streamer_, resolver_.target(), versionsDir());
  if (deps.required()) {
    enter(DownloadStage::INSTALLING_DEPENDENCY, version);
    try {
      deps.ensureInstalled();
    } catch (const Error &e) {
      throw Error(e.kind(), "Failed to install " +
                                DependencyInstaller::SDL2_DLL + " for " + tag +
                                ": " + e.what());
    }
  }

  enter(DownloadStage::FINALIZING, version);
  finalize(binary, version);

  enter(DownloadStage::SUCCEEDED, version);
  LOG_INFO("Version " + tag + " installed");
  return version;
}

DownloadOutcome DownloadEngine::run(const Version &version) {
  DownloadOutcome outcome;
  outcome.requested = version;
  try {
    outcome.installed = install(version);
    return outcome;
  } catch (const Error &e) {
    outcome.errorKind = e.kind();
    outcome.error = e.what();
    LOG_ERROR("Version download failed: " + outcome.error);
  } catch (const std::logic_error &e) {
    outcome.errorKind = ErrorKind::CONTRACT;
    outcome.error = e.what();
    LOG_ERROR("Download engine misuse (" + outcome.error +
              "), request for v" + version.render() + " aborted");
  } catch (const std::exception &e) {
    outcome.errorKind = ErrorKind::IO;
    outcome.error = "Download of v" + version.render() +
                    " failed: " + std::string(e.what());
    LOG_ERROR(outcome.error);
  }
  enter(DownloadStage::FAILED, version);
  return outcome;
}

} // namespace mplaunch
