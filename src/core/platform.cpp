#include "mplaunch/platform.hpp"

namespace mplaunch {

Target Target::current() {
  Target t;
#if defined(_WIN32)
  t.platform = Platform::WINDOWS;
#elif defined(__APPLE__)
  t.platform = Platform::MACOS;
#elif defined(__linux__)
  t.platform = Platform::LINUX;
#endif

#if defined(__x86_64__) || defined(_M_X64)
  t.arch = Arch::X86_64;
#elif defined(__aarch64__) || defined(_M_ARM64)
  t.arch = Arch::AARCH64;
#endif
  return t;
}

std::string Target::platformToken() const {
  switch (platform) {
  case Platform::LINUX:
    return "linux";
  case Platform::WINDOWS:
    return "windows";
  case Platform::MACOS:
    return "macos";
  default:
    return "unknown";
  }
}

std::string Target::archToken() const {
  switch (arch) {
  case Arch::X86_64:
    return "x86_64";
  case Arch::AARCH64:
    return "aarch64";
  default:
    return "unknown";
  }
}

std::string Target::binarySuffix() const {
  switch (platform) {
  case Platform::WINDOWS:
    return ".exe";
  case Platform::MACOS:
    return ".app";
  default:
    return "";
  }
}

} // namespace mplaunch
