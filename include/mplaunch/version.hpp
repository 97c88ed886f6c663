#ifndef MPLAUNCH_VERSION_HPP
#define MPLAUNCH_VERSION_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mplaunch {

const std::string MPLAUNCH_VERSION_STRING = "0.3.0";
const int MPLAUNCH_VERSION_MAJOR = 0;
const int MPLAUNCH_VERSION_MINOR = 3;
const int MPLAUNCH_VERSION_PATCH = 0;

// Declaration order is the sort order.
enum class VersionStage { ALPHA, BETA, RELEASE };

// A game build identifier: major.minor.patch[-stage][.build]
class Version {
public:
  Version() = default;
  Version(uint32_t majorNum, uint32_t minorNum, uint32_t patchNum,
          VersionStage stage = VersionStage::RELEASE, uint32_t build = 0);

  // Throws mplaunch::Error (ErrorKind::Parse) naming the offending field.
  static Version parse(const std::string &input);

  // Canonical form. parse(render()) yields an equal Version.
  std::string render() const;

  // <0, 0, >0 like strcmp.
  static int compare(const Version &a, const Version &b);

  uint32_t getMajor() const { return major_; }
  uint32_t getMinor() const { return minor_; }
  uint32_t getPatch() const { return patch_; }
  VersionStage getStage() const { return stage_; }
  uint32_t getBuild() const { return build_; }

  bool operator==(const Version &other) const;
  bool operator!=(const Version &other) const { return !(*this == other); }
  bool operator<(const Version &other) const { return compare(*this, other) < 0; }
  bool operator>(const Version &other) const { return compare(*this, other) > 0; }
  bool operator<=(const Version &other) const { return compare(*this, other) <= 0; }
  bool operator>=(const Version &other) const { return compare(*this, other) >= 0; }

private:
  // The launcher suggests 0.2.2 when nothing else is known.
  uint32_t major_ = 0;
  uint32_t minor_ = 2;
  uint32_t patch_ = 2;
  VersionStage stage_ = VersionStage::RELEASE;
  uint32_t build_ = 0;
};

std::string stageName(VersionStage stage);

} // namespace mplaunch

namespace std {
template <> struct hash<mplaunch::Version> {
  size_t operator()(const mplaunch::Version &v) const noexcept {
    size_t h = std::hash<uint32_t>{}(v.getMajor());
    auto mix = [&h](size_t value) {
      h ^= value + static_cast<size_t>(0x9e3779b97f4a7c15ULL) + (h << 6) + (h >> 2);
    };
    mix(std::hash<uint32_t>{}(v.getMinor()));
    mix(std::hash<uint32_t>{}(v.getPatch()));
    mix(static_cast<size_t>(v.getStage()));
    mix(std::hash<uint32_t>{}(v.getBuild()));
    return h;
  }
};
} // namespace std

#endif // MPLAUNCH_VERSION_HPP
