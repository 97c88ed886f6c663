#ifndef MPLAUNCH_DOWNLOAD_ENGINE_HPP
#define MPLAUNCH_DOWNLOAD_ENGINE_HPP

#include "mplaunch/asset_resolver.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/http.hpp"
#include "mplaunch/progress_channel.hpp"
#include "mplaunch/stream_downloader.hpp"
#include "mplaunch/version.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace mplaunch {

enum class DownloadStage {
  IDLE,
  FETCHING_METADATA,
  RESOLVING_ASSET,
  STREAMING,
  INSTALLING_DEPENDENCY,
  FINALIZING,
  SUCCEEDED,
  FAILED
};

std::string downloadStageName(DownloadStage stage);

// Terminal result of one download request, handed back to the UI loop.
struct DownloadOutcome {
  Version requested;
  std::optional<Version> installed;
  ErrorKind errorKind = ErrorKind::IO;
  std::string error;

  bool succeeded() const { return installed.has_value(); }
};

class DownloadEngine {
public:
  using StageCallback = std::function<void(DownloadStage)>;

  DownloadEngine(HttpClient &http, const AssetResolver &resolver,
                 const std::filesystem::path &gameDir);

  // Must be called before the first install().
  void setProgressSender(ProgressSender sender) { sender_ = std::move(sender); }
  void setStageCallback(StageCallback callback) {
    stageCallback_ = std::move(callback);
  }
  void setProgressInterval(std::chrono::milliseconds interval);
  void setClock(SteadyClock clock);

  // Runs the whole pipeline for one version. Throws Error on any failed step
  // and std::logic_error when no progress sender was set.
  Version install(const Version &version);

  // install() with every failure folded into the outcome.
  DownloadOutcome run(const Version &version);

  std::filesystem::path versionsDir() const { return gameDir_ / "versions"; }
  const AssetResolver &resolver() const { return resolver_; }

private:
  HttpClient &http_;
  AssetResolver resolver_;
  std::filesystem::path gameDir_;
  StreamDownloader streamer_;
  ProgressSender sender_;
  StageCallback stageCallback_;

  void enter(DownloadStage stage, const Version &version);
  std::string fetchMetadata(const Version &version);
  void finalize(const std::filesystem::path &binary, const Version &version);
};

} // namespace mplaunch

#endif // MPLAUNCH_DOWNLOAD_ENGINE_HPP
