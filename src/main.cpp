#include "mplaunch/config.hpp"
#include "mplaunch/http.hpp"
#include "mplaunch/launcher.hpp"
#include "mplaunch/logger.hpp"
#include "mplaunch/path_manager.hpp"
#include "mplaunch/platform.hpp"
#include "mplaunch/task_runner.hpp"
#include "mplaunch/version.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

void showHelp() {
  std::cout
      << "mplaunch - Mineplace3D launcher\n\n"
      << "Usage: mplaunch [command] [args...]\n\n"
      << "Commands:\n"
      << "  install <version>        Download and install a game version\n"
      << "  run <version>            Launch an installed version\n"
      << "  list                     List installed versions, newest first\n"
      << "  config [--game-dir DIR]  Show settings, or set the game "
         "directory\n"
      << "  help                     Show this help message\n\n"
      << "Flags:\n"
      << "  -v, --verbose  Enable verbose logging to stdout\n"
      << "  --version      Print the launcher version\n";
}

static std::string formatSpeed(double bytesPerSecond) {
  const char *units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
  int unit = 0;
  while (bytesPerSecond >= 1024.0 && unit < 3) {
    bytesPerSecond /= 1024.0;
    unit++;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", bytesPerSecond, units[unit]);
  return buf;
}

static void renderProgress(const mplaunch::State &state) {
  const int width = 30;
  int filled = static_cast<int>(state.getProgress() * width);
  std::string bar(filled, '#');
  bar.resize(width, ' ');
  std::cout << "\r[" << bar << "] "
            << static_cast<int>(state.getProgress() * 100.0f) << "%  "
            << formatSpeed(state.getSpeed()) << "        " << std::flush;
}

static int cmdInstall(mplaunch::Launcher &launcher, const std::string &input) {
  using Request = mplaunch::Launcher::Request;
  switch (launcher.requestDownload(input)) {
  case Request::INVALID_INPUT:
    std::cerr << launcher.state().getStatus() << "\n";
    return 2;
  case Request::ALREADY_INSTALLED:
    std::cout << "Version " << input << " is already installed.\n";
    return 0;
  case Request::BUSY:
    std::cerr << "A download is already in progress.\n";
    return 1;
  case Request::DISPATCHED:
    break;
  }

  std::cout << launcher.state().getStatus() << "\n";
  std::optional<mplaunch::DownloadOutcome> outcome;
  while (!outcome) {
    outcome = launcher.poll();
    renderProgress(launcher.state());
    if (!outcome)
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  std::cout << "\n";

  if (!outcome->succeeded()) {
    std::cerr << "Version download failed: " << outcome->error << "\n";
    return 1;
  }
  std::cout << launcher.state().getStatus() << "\n";
  return 0;
}

static int cmdRun(mplaunch::Launcher &launcher, const std::string &input) {
  try {
    launcher.runVersion(mplaunch::Version::parse(input));
    return 0;
  } catch (const mplaunch::Error &e) {
    std::cerr << "Error running version: " << e.what() << "\n";
    return e.kind() == mplaunch::ErrorKind::PARSE ? 2 : 1;
  }
}

static int cmdList(mplaunch::Launcher &launcher) {
  auto versions = launcher.registry().sortedDescending();
  if (versions.empty()) {
    std::cout << "No versions installed in " << launcher.gameDir().string()
              << "\n";
    return 0;
  }
  for (const auto &v : versions)
    std::cout << "v" << v.render() << "\n";
  return 0;
}

static int cmdConfig(const std::vector<std::string> &args) {
  auto &cfg = mplaunch::Config::instance();
  auto &settings = cfg.getSettings();
  auto &pathMgr = mplaunch::PathManager::instance();

  auto it = std::find(args.begin(), args.end(), "--game-dir");
  if (it != args.end()) {
    if (std::next(it) == args.end()) {
      std::cerr << "--game-dir needs a path\n";
      return 2;
    }
    settings.gameDir = std::filesystem::absolute(*std::next(it)).string();
    try {
      pathMgr.setGameDir(settings.gameDir);
    } catch (const std::filesystem::filesystem_error &e) {
      std::cerr << "Failed to create game directory: " << e.what() << "\n";
      return 1;
    }
    cfg.save();
    std::cout << "Settings saved successfully. New game directory: "
              << pathMgr.gameDir().string() << "\n";
    return 0;
  }

  std::cout << "config file:  " << cfg.path().string() << "\n"
            << "game dir:     " << pathMgr.gameDir().string() << "\n"
            << "repository:   " << settings.repo << "\n"
            << "target:       " << mplaunch::Target::current().describe()
            << "\n"
            << "log file:     " << pathMgr.currentLog().string() << "\n";
  return 0;
}

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  if (!args.empty() &&
      (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
    showHelp();
    return 0;
  }

  if (!args.empty() && args[0] == "--version") {
    std::cout << "mplaunch v" << mplaunch::MPLAUNCH_VERSION_STRING << "\n";
    return 0;
  }

  bool verbose = false;
  auto it = std::find_if(args.begin(), args.end(), [](const std::string &arg) {
    return arg == "-v" || arg == "--verbose";
  });
  if (it != args.end()) {
    verbose = true;
    args.erase(it);
  }

  auto &pathMgr = mplaunch::PathManager::instance();
  try {
    pathMgr.init();
  } catch (const std::exception &e) {
    std::cerr << "Failed to prepare launcher directories: " << e.what()
              << "\n";
    return 1;
  }
  mplaunch::Logger::instance().init(pathMgr.currentLog(), verbose);
  LOG_INFO("mplaunch v" + mplaunch::MPLAUNCH_VERSION_STRING + " started");

  auto &cfg = mplaunch::Config::instance();
  cfg.load(pathMgr.configFile());
  const auto settings = cfg.getSettings();

  try {
    pathMgr.setGameDir(settings.gameDir);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create game directory: " + std::string(e.what()));
    return 1;
  }

  std::string command = args.empty() ? "list" : args[0];
  LOG_INFO("Command: " + command);

  if (command == "config")
    return cmdConfig(args);

  int rc = 2;
  {
    auto http = std::make_shared<mplaunch::CurlHttpClient>(
        settings.userAgent, settings.connectTimeoutSecs);
    mplaunch::Launcher launcher(settings, pathMgr.gameDir(),
                                mplaunch::Target::current(), http);

    if (command == "install" && args.size() >= 2) {
      rc = cmdInstall(launcher, args[1]);
    } else if (command == "run" && args.size() >= 2) {
      rc = cmdRun(launcher, args[1]);
    } else if (command == "list") {
      rc = cmdList(launcher);
    } else {
      showHelp();
    }
  }

  mplaunch::TaskRunner::instance().shutdown();
  return rc;
}
