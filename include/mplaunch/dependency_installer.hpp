#ifndef MPLAUNCH_DEPENDENCY_INSTALLER_HPP
#define MPLAUNCH_DEPENDENCY_INSTALLER_HPP

#include "mplaunch/platform.hpp"
#include "mplaunch/stream_downloader.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace mplaunch {

// Drops SDL2.dll next to Windows builds. Other targets get SDL2 from the
// system (linux) or from the app bundle (macos).
class DependencyInstaller {
public:
  DependencyInstaller(StreamDownloader &downloader, const Target &target,
                      const std::filesystem::path &versionsDir);

  static const std::string SDL2_DLL;
  static const std::string SDL2_URL_X86_64;
  // No official arm64 builds exist, this one is community maintained.
  static const std::string SDL2_URL_AARCH64;

  bool required() const;
  bool isPresent() const;
  std::optional<std::string> vendorUrl() const;

  std::filesystem::path dllPath() const { return versionsDir_ / SDL2_DLL; }
  std::filesystem::path tempArchivePath() const {
    return versionsDir_ / "sdl2_temp.zip";
  }

  // Returns true when SDL2.dll was installed by this call, false when it was
  // not needed. Throws Error on any failed sub-step.
  bool ensureInstalled();

private:
  StreamDownloader &downloader_;
  Target target_;
  std::filesystem::path versionsDir_;
};

} // namespace mplaunch

#endif // MPLAUNCH_DEPENDENCY_INSTALLER_HPP
