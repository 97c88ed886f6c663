#ifndef MPLAUNCH_LAUNCHER_HPP
#define MPLAUNCH_LAUNCHER_HPP

#include "mplaunch/config.hpp"
#include "mplaunch/download_engine.hpp"
#include "mplaunch/http.hpp"
#include "mplaunch/platform.hpp"
#include "mplaunch/progress_channel.hpp"
#include "mplaunch/state.hpp"
#include "mplaunch/version_registry.hpp"
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mplaunch {

// The shell side of the launcher: everything a UI calls into. Not thread safe;
// all calls come from the single UI loop, the download itself runs on a
// TaskRunner thread.
class Launcher {
public:
  enum class Request { DISPATCHED, INVALID_INPUT, ALREADY_INSTALLED, BUSY };

  Launcher(const LauncherSettings &settings,
           const std::filesystem::path &gameDir, const Target &target,
           std::shared_ptr<HttpClient> http);
  ~Launcher();

  Launcher(const Launcher &) = delete;
  Launcher &operator=(const Launcher &) = delete;

  // Parses user input and hands it to the overload below. Bad input is
  // rejected here and never reaches the engine.
  Request requestDownload(const std::string &input);
  Request requestDownload(const Version &version);

  // One UI tick: drains progress events into state(), folds a finished
  // download into the registry and clears the finished banner after its
  // cooldown. Returns the outcome on the tick a download resolves.
  std::optional<DownloadOutcome> poll();

  // Blocks until the in-flight download (if any) resolves, then polls.
  std::optional<DownloadOutcome> wait();

  // Starts an installed build. Throws Error(LAUNCH) when it is not installed,
  // SDL2 is missing or the process cannot be spawned.
  void runVersion(const Version &version);
  bool sdl2Available() const;

  bool isDownloading() const { return downloading_; }
  const State &state() const { return state_; }
  VersionRegistry &registry() { return registry_; }
  const std::filesystem::path &gameDir() const { return gameDir_; }

  // Re-reads versions.json, e.g. after the game directory changed.
  void reloadVersions();

private:
  LauncherSettings settings_;
  std::filesystem::path gameDir_;
  Target target_;
  std::shared_ptr<HttpClient> http_;
  DownloadEngine engine_;
  ProgressReceiver progress_;
  VersionRegistry registry_;
  State state_;

  bool downloading_ = false;
  std::future<DownloadOutcome> pending_;
  std::chrono::steady_clock::time_point finishedAt_;

  void drainProgress();
  void complete(const DownloadOutcome &outcome);
};

} // namespace mplaunch

#endif // MPLAUNCH_LAUNCHER_HPP
