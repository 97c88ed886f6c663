#include "mplaunch/dependency_installer.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/logger.hpp"
#include "mplaunch/zip_util.hpp"

namespace mplaunch {

const std::string DependencyInstaller::SDL2_DLL = "SDL2.dll";
const std::string DependencyInstaller::SDL2_URL_X86_64 =
    "https://www.libsdl.org/release/SDL2-2.0.14-win32-x64.zip";
const std::string DependencyInstaller::SDL2_URL_AARCH64 =
    "https://www.github.com/mmozeiko/build-sdl2/releases/download/2025-12-28/"
    "SDL2-arm64-2025-12-28.zip";

DependencyInstaller::DependencyInstaller(
    StreamDownloader &downloader, const Target &target,
    const std::filesystem::path &versionsDir)
    : downloader_(downloader), target_(target), versionsDir_(versionsDir) {}

bool DependencyInstaller::required() const {
  return target_.needsSdlDll() && !isPresent();
}

bool DependencyInstaller::isPresent() const {
  std::error_code ec;
  return std::filesystem::exists(dllPath(), ec);
}

std::optional<std::string> DependencyInstaller::vendorUrl() const {
  switch (target_.arch) {
  case Arch::X86_64:
    return SDL2_URL_X86_64;
  case Arch::AARCH64:
    return SDL2_URL_AARCH64;
  default:
    return std::nullopt;
  }
}

bool DependencyInstaller::ensureInstalled() {
  if (!required())
    return false;

  auto url = vendorUrl();
  if (!url) {
    throw Error(ErrorKind::RESOLUTION, "No " + SDL2_DLL + " build available for " +
                                           target_.describe());
  }

  LOG_INFO(SDL2_DLL + " missing, fetching " + *url);
  const auto archive = tempArchivePath();
  downloader_.download(*url, archive, SDL2_DLL);

  ZipUtil::extractMember(archive, SDL2_DLL, dllPath());

  std::error_code ec;
  std::filesystem::remove(archive, ec);
  if (ec) {
    throw Error(ErrorKind::IO, "Failed to remove temporary " + SDL2_DLL +
                                   " zip file: " + ec.message());
  }

  LOG_INFO("Installed " + dllPath().string());
  return true;
}

} // namespace mplaunch
