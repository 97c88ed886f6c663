// tests/version_tests.cpp
//
// Version parsing, canonical rendering and ordering.

#include <doctest/doctest.h>

#include "mplaunch/error.hpp"
#include "mplaunch/version.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <vector>

using mplaunch::Version;
using mplaunch::VersionStage;

namespace {

std::string parseFailure(const std::string &input) {
  try {
    Version::parse(input);
  } catch (const mplaunch::Error &e) {
    CHECK(e.kind() == mplaunch::ErrorKind::PARSE);
    return e.what();
  }
  FAIL("expected '" << input << "' to be rejected");
  return "";
}

bool mentions(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Version::parse reads plain triples") {
  Version v = Version::parse("1.2.3");
  CHECK(v.getMajor() == 1);
  CHECK(v.getMinor() == 2);
  CHECK(v.getPatch() == 3);
  CHECK(v.getStage() == VersionStage::RELEASE);
  CHECK(v.getBuild() == 0);
}

TEST_CASE("Version::parse tolerates a leading v and surrounding whitespace") {
  CHECK(Version::parse("v0.2.2") == Version(0, 2, 2));
  CHECK(Version::parse("  0.2.2\n") == Version(0, 2, 2));
  CHECK(Version::parse(" v1.0.0-beta.2 ") ==
        Version(1, 0, 0, VersionStage::BETA, 2));
}

TEST_CASE("Version::parse strips every leading v") {
  CHECK(Version::parse("vv1.0.0") == Version(1, 0, 0));
  CHECK(Version::parse("vvv0.2.2-beta") == Version(0, 2, 2, VersionStage::BETA));
  CHECK(mentions(parseFailure("vvv"), "empty"));
  CHECK(mentions(parseFailure("v1.0.0v"), "patch"));
}

TEST_CASE("Version::parse accepts an explicit plus sign on numbers") {
  CHECK(Version::parse("+1.0.0") == Version(1, 0, 0));
  CHECK(Version::parse("1.+2.+3-alpha.+4") ==
        Version(1, 2, 3, VersionStage::ALPHA, 4));
  CHECK(Version::parse("+1.0.0").render() == "1.0.0");
}

TEST_CASE("Version::parse reads stage and build") {
  CHECK(Version::parse("1.0.0-alpha") == Version(1, 0, 0, VersionStage::ALPHA));
  CHECK(Version::parse("1.0.0-alpha.3") ==
        Version(1, 0, 0, VersionStage::ALPHA, 3));
  CHECK(Version::parse("1.0.0-release.4") ==
        Version(1, 0, 0, VersionStage::RELEASE, 4));
  // Non-canonical but accepted, renders without the stage
  CHECK(Version::parse("1.0.0-release") == Version(1, 0, 0));
}

TEST_CASE("default Version is the suggested 0.2.2 release") {
  Version v;
  CHECK(v.render() == "0.2.2");
  CHECK(v.getStage() == VersionStage::RELEASE);
}

TEST_CASE("Version::render produces the canonical form") {
  CHECK(Version(1, 2, 3).render() == "1.2.3");
  CHECK(Version(1, 2, 3, VersionStage::BETA).render() == "1.2.3-beta");
  CHECK(Version(1, 2, 3, VersionStage::ALPHA, 7).render() == "1.2.3-alpha.7");
  CHECK(Version(1, 2, 3, VersionStage::RELEASE, 4).render() ==
        "1.2.3-release.4");
}

TEST_CASE("canonical strings survive a parse/render cycle") {
  const std::vector<std::string> canonical = {
      "0.0.0",         "0.2.2",       "10.20.30",   "1.0.0-alpha",
      "1.0.0-alpha.1", "1.0.0-beta",  "2.1.0-beta.12",
      "3.0.0-release.1", "4294967295.0.1"};
  for (const auto &s : canonical) {
    INFO("version: " << s);
    CHECK(Version::parse(s).render() == s);
  }
}

TEST_CASE("Version ordering follows major, minor, patch, stage, build") {
  CHECK(Version::parse("1.0.0") < Version::parse("1.0.1"));
  CHECK(Version::parse("1.0.9") < Version::parse("1.1.0"));
  CHECK(Version::parse("1.9.9") < Version::parse("2.0.0"));
  CHECK(Version::parse("1.0.0-alpha") < Version::parse("1.0.0-beta"));
  CHECK(Version::parse("1.0.0-beta") < Version::parse("1.0.0"));
  CHECK(Version::parse("1.0.0-beta.1") < Version::parse("1.0.0-beta.2"));
  CHECK(Version::parse("1.0.0") < Version::parse("1.0.0-release.1"));
  CHECK(Version::parse("0.9.0") < Version::parse("1.0.0-alpha"));
}

TEST_CASE("Version::compare is numeric, not lexicographic on text") {
  CHECK(Version::parse("0.10.0") > Version::parse("0.9.0"));
  CHECK(Version::parse("1.0.0-beta.10") > Version::parse("1.0.0-beta.9"));
}

TEST_CASE("equal versions compare equal and hash equal") {
  Version a = Version::parse("v1.0.0-beta.2");
  Version b(1, 0, 0, VersionStage::BETA, 2);
  CHECK(a == b);
  CHECK(Version::compare(a, b) == 0);
  CHECK(std::hash<Version>{}(a) == std::hash<Version>{}(b));

  std::unordered_set<Version> set = {a};
  CHECK(set.count(b) == 1);
  CHECK(set.insert(b).second == false);
}

TEST_CASE("Version sorts into a total order") {
  std::vector<Version> versions = {
      Version::parse("1.0.0"),        Version::parse("0.2.2"),
      Version::parse("1.0.0-beta.1"), Version::parse("1.0.0-alpha"),
      Version::parse("1.0.0-release.2"), Version::parse("0.10.0")};
  std::sort(versions.begin(), versions.end());

  std::vector<std::string> rendered;
  for (const auto &v : versions)
    rendered.push_back(v.render());
  CHECK(rendered == std::vector<std::string>{"0.2.2", "0.10.0", "1.0.0-alpha",
                                             "1.0.0-beta.1", "1.0.0",
                                             "1.0.0-release.2"});
}

TEST_CASE("Version::parse rejects empty input") {
  CHECK(mentions(parseFailure(""), "empty"));
  CHECK(mentions(parseFailure("   "), "empty"));
  CHECK(mentions(parseFailure("v"), "empty"));
}

TEST_CASE("Version::parse rejects the wrong number of components") {
  CHECK(mentions(parseFailure("1.0"), "major.minor.patch"));
  CHECK(mentions(parseFailure("1.0.0.0"), "major.minor.patch"));
  CHECK(mentions(parseFailure("1"), "major.minor.patch"));
}

TEST_CASE("Version::parse names the offending numeric field") {
  CHECK(mentions(parseFailure("x.0.0"), "major"));
  CHECK(mentions(parseFailure("1.y.0"), "minor"));
  CHECK(mentions(parseFailure("1.0.z"), "patch"));
  CHECK(mentions(parseFailure("1.0.0-beta.x"), "build"));
  CHECK(mentions(parseFailure("1.++1.0"), "minor"));
  CHECK(mentions(parseFailure("1.+.0"), "minor"));
  CHECK(mentions(parseFailure("1. 2.0"), "minor"));
  CHECK(mentions(parseFailure("1.0.99999999999"), "patch"));
}

TEST_CASE("Version::parse rejects unknown stages") {
  CHECK(mentions(parseFailure("1.0.0-gamma"), "stage"));
  CHECK(mentions(parseFailure("1.0.0-Beta"), "stage"));
  CHECK(mentions(parseFailure("1.0.0-rc.1"), "stage"));
}

TEST_CASE("stageName matches the rendered stage token") {
  CHECK(mplaunch::stageName(VersionStage::ALPHA) == "alpha");
  CHECK(mplaunch::stageName(VersionStage::BETA) == "beta");
  CHECK(mplaunch::stageName(VersionStage::RELEASE) == "release");
}
