#ifndef MPLAUNCH_PLATFORM_HPP
#define MPLAUNCH_PLATFORM_HPP

#include <string>

namespace mplaunch {

enum class Platform { LINUX, WINDOWS, MACOS, UNKNOWN };
enum class Arch { X86_64, AARCH64, UNKNOWN };

// The (platform x architecture) pair the launcher installs for. Resolved once
// at startup and passed around as data so tests can pose as any target.
struct Target {
  Platform platform = Platform::UNKNOWN;
  Arch arch = Arch::UNKNOWN;

  static Target current();

  std::string platformToken() const;
  std::string archToken() const;

  // ".exe" on windows, ".app" on macos, "" elsewhere
  std::string binarySuffix() const;

  bool isPosix() const { return platform != Platform::WINDOWS; }
  bool needsSdlDll() const { return platform == Platform::WINDOWS; }

  std::string describe() const { return platformToken() + "-" + archToken(); }
};

} // namespace mplaunch

#endif // MPLAUNCH_PLATFORM_HPP
