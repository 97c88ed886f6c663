#include "mplaunch/launcher.hpp"
#include "mplaunch/dependency_installer.hpp"
#include "mplaunch/logger.hpp"
#include "mplaunch/process.hpp"
#include "mplaunch/task_runner.hpp"
#include <map>
#include <vector>

namespace mplaunch {

Launcher::Launcher(const LauncherSettings &settings,
                   const std::filesystem::path &gameDir, const Target &target,
                   std::shared_ptr<HttpClient> http)
    : settings_(settings), gameDir_(gameDir), target_(target),
      http_(std::move(http)),
      engine_(*http_, AssetResolver(settings.repo, settings.product, target),
              gameDir),
      registry_(gameDir / "versions" / "versions.json") {
  // The engine refuses to run without a sender, so wire it up first.
  auto [sender, receiver] = ProgressChannel::create();
  engine_.setProgressSender(sender);
  progress_ = receiver;
  engine_.setProgressInterval(
      std::chrono::milliseconds(settings_.progressIntervalMs));

  reloadVersions();
}

Launcher::~Launcher() {
  if (pending_.valid())
    pending_.wait();
}

void Launcher::reloadVersions() {
  try {
    registry_.load();
  } catch (const Error &e) {
    LOG_ERROR(std::string(e.what()) + ". Starting with no installed versions.");
  }
}

Launcher::Request Launcher::requestDownload(const std::string &input) {
  Version version;
  try {
    version = Version::parse(input);
  } catch (const Error &e) {
    LOG_WARN("Invalid version format '" + input + "': " + e.what());
    state_.setStatus(std::string("Invalid version: ") + e.what());
    return Request::INVALID_INPUT;
  }
  return requestDownload(version);
}

Launcher::Request Launcher::requestDownload(const Version &version) {
  if (registry_.contains(version)) {
    LOG_INFO("Version v" + version.render() + " is already installed");
    return Request::ALREADY_INSTALLED;
  }
  if (downloading_) {
    LOG_WARN("A download is already in progress, ignoring v" +
             version.render());
    return Request::BUSY;
  }

  downloading_ = true;
  state_.reset();
  state_.set(AppState::DOWNLOADING);
  state_.setStatus("Downloading v" + version.render() + "...");

  pending_ = TaskRunner::instance().async(
      [this, version]() { return engine_.run(version); });
  return Request::DISPATCHED;
}

void Launcher::drainProgress() {
  while (auto event = progress_.tryReceive())
    state_.apply(*event);
}

void Launcher::complete(const DownloadOutcome &outcome) {
  downloading_ = false;

  if (!outcome.succeeded()) {
    state_.set(AppState::ERROR);
    state_.setStatus(outcome.error);
    return;
  }

  const Version &version = *outcome.installed;
  registry_.insert(version);
  try {
    registry_.save();
  } catch (const Error &e) {
    LOG_ERROR(e.what());
  }

  state_.set(AppState::FINISHED);
  state_.setStatus("Version v" + version.render() + " downloaded successfully");
  finishedAt_ = std::chrono::steady_clock::now();
  LOG_INFO("Version v" + version.render() + " downloaded successfully");
}

std::optional<DownloadOutcome> Launcher::poll() {
  drainProgress();

  if (pending_.valid() &&
      pending_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    DownloadOutcome outcome = pending_.get();
    drainProgress();
    complete(outcome);
    return outcome;
  }

  if (state_.get() == AppState::FINISHED &&
      std::chrono::steady_clock::now() - finishedAt_ >=
          std::chrono::milliseconds(settings_.bannerCooldownMs)) {
    state_.reset();
  }
  return std::nullopt;
}

std::optional<DownloadOutcome> Launcher::wait() {
  if (pending_.valid())
    pending_.wait();
  return poll();
}

bool Launcher::sdl2Available() const {
  switch (target_.platform) {
  case Platform::WINDOWS: {
    std::error_code ec;
    return std::filesystem::exists(
        gameDir_ / "versions" / DependencyInstaller::SDL2_DLL, ec);
  }
  case Platform::LINUX: {
    auto output = Process::captureOutput("ldconfig -p");
    return output && output->find("libSDL2") != std::string::npos;
  }
  case Platform::MACOS:
    return true; // shipped inside the app bundle
  default:
    return false;
  }
}

void Launcher::runVersion(const Version &version) {
  const std::string tag = "v" + version.render();
  if (!registry_.contains(version))
    throw Error(ErrorKind::LAUNCH, "Version " + tag + " is not available");

  if (!sdl2Available()) {
    if (target_.platform == Platform::WINDOWS) {
      throw Error(ErrorKind::LAUNCH,
                  "SDL2 library is not installed. Please put the correct "
                  "SDL2.dll depending on your architecture into " +
                      (gameDir_ / "versions").string() + " to run the game.");
    }
    throw Error(ErrorKind::LAUNCH,
                "SDL2 library is not installed. Please install sdl2-compat "
                "using your package manager to run the game.");
  }

  const auto exe = engine_.resolver().binaryPath(gameDir_ / "versions", version);
  std::vector<std::string> argv;
  if (target_.platform == Platform::MACOS)
    argv = {"open", exe.string()};
  else
    argv = {exe.string()};

  std::map<std::string, std::string> env = {
      {"MINEPLACE3D_GAME_DIR", std::filesystem::absolute(gameDir_).string()}};

  try {
    Process::spawnDetached(argv, env);
  } catch (const Error &e) {
    throw Error(ErrorKind::LAUNCH, "Failed to launch version " + tag + " at " +
                                       exe.string() + ": " + e.what());
  }
}

} // namespace mplaunch
