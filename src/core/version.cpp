#include "mplaunch/version.hpp"
#include "mplaunch/error.hpp"
#include <charconv>
#include <vector>

namespace mplaunch {

static std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

static std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> parts;
  size_t start = 0;
  for (;;) {
    size_t pos = s.find(sep, start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

// Digits with an optional leading '+', must fit in 32 bits.
static uint32_t parseField(const std::string &text, const std::string &field) {
  uint32_t value = 0;
  const char *begin = text.data();
  const char *end = begin + text.size();
  if (begin != end && *begin == '+')
    ++begin;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (begin == end || ec != std::errc() || ptr != end) {
    throw Error(ErrorKind::PARSE,
                "Invalid " + field + " version: '" + text + "'");
  }
  return value;
}

std::string stageName(VersionStage stage) {
  switch (stage) {
  case VersionStage::ALPHA:
    return "alpha";
  case VersionStage::BETA:
    return "beta";
  case VersionStage::RELEASE:
    return "release";
  }
  return "release";
}

Version::Version(uint32_t majorNum, uint32_t minorNum, uint32_t patchNum,
                 VersionStage stage, uint32_t build)
    : major_(majorNum), minor_(minorNum), patch_(patchNum), stage_(stage),
      build_(build) {}

Version Version::parse(const std::string &input) {
  std::string s = trim(input);
  s.erase(0, s.find_first_not_of('v'));
  if (s.empty())
    throw Error(ErrorKind::PARSE, "Version string cannot be empty");

  std::string core = s;
  std::string stagePart;
  bool hasStage = false;
  auto dash = s.find('-');
  if (dash != std::string::npos) {
    core = s.substr(0, dash);
    stagePart = s.substr(dash + 1);
    hasStage = true;
  }

  auto coreParts = split(core, '.');
  if (coreParts.size() != 3) {
    throw Error(ErrorKind::PARSE,
                "Version must be in the format major.minor.patch: '" + input +
                    "'");
  }

  uint32_t majorNum = parseField(coreParts[0], "major");
  uint32_t minorNum = parseField(coreParts[1], "minor");
  uint32_t patchNum = parseField(coreParts[2], "patch");

  if (!hasStage)
    return Version(majorNum, minorNum, patchNum);

  auto stageParts = split(stagePart, '.');
  VersionStage stage;
  if (stageParts[0] == "alpha") {
    stage = VersionStage::ALPHA;
  } else if (stageParts[0] == "beta") {
    stage = VersionStage::BETA;
  } else if (stageParts[0] == "release") {
    stage = VersionStage::RELEASE;
  } else {
    throw Error(ErrorKind::PARSE,
                "Invalid version stage: '" + stageParts[0] + "'");
  }

  uint32_t build = 0;
  if (stageParts.size() > 1)
    build = parseField(stageParts[1], "build");

  return Version(majorNum, minorNum, patchNum, stage, build);
}

std::string Version::render() const {
  std::string out = std::to_string(major_) + "." + std::to_string(minor_) +
                    "." + std::to_string(patch_);
  if (stage_ != VersionStage::RELEASE)
    out += "-" + stageName(stage_);
  if (build_ > 0) {
    if (stage_ == VersionStage::RELEASE)
      out += "-release";
    out += "." + std::to_string(build_);
  }
  return out;
}

int Version::compare(const Version &a, const Version &b) {
  auto cmp = [](auto x, auto y) { return x < y ? -1 : (x > y ? 1 : 0); };
  if (int c = cmp(a.major_, b.major_))
    return c;
  if (int c = cmp(a.minor_, b.minor_))
    return c;
  if (int c = cmp(a.patch_, b.patch_))
    return c;
  if (int c = cmp(static_cast<int>(a.stage_), static_cast<int>(b.stage_)))
    return c;
  return cmp(a.build_, b.build_);
}

bool Version::operator==(const Version &other) const {
  return major_ == other.major_ && minor_ == other.minor_ &&
         patch_ == other.patch_ && stage_ == other.stage_ &&
         build_ == other.build_;
}

} // namespace mplaunch
