// tests/download_engine_tests.cpp
//
// The install pipeline end to end against a fake transport: metadata fetch,
// asset resolution, streaming, SDL2 provisioning and finalization.

#include <doctest/doctest.h>

#include "mplaunch/dependency_installer.hpp"
#include "mplaunch/download_engine.hpp"
#include "mplaunch/error.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace mplaunch;
using namespace mplaunch::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

const std::string REPO = "Muhtasim-Rasheed/mineplace3d";
const std::string META_URL =
    "https://api.github.com/repos/Muhtasim-Rasheed/mineplace3d/releases/tags/"
    "v1.2.3";
const std::string LINUX_URL = "https://dl.example/mineplace3d-linux-x86_64";
const std::string WINDOWS_URL =
    "https://dl.example/mineplace3d-windows-x86_64.exe";

struct EngineFixture {
  TempDir root;
  FakeHttpClient http;
  ProgressSender sender;
  ProgressReceiver receiver;
  std::vector<DownloadStage> stages;
  DownloadEngine engine;

  explicit EngineFixture(const Target &target)
      : engine(http, AssetResolver(REPO, "mineplace3d", target),
               root / "game") {
    auto channel = ProgressChannel::create();
    sender = channel.first;
    receiver = channel.second;
    engine.setProgressSender(sender);
    engine.setClock(steppingClock(300ms));
    engine.setStageCallback(
        [this](DownloadStage stage) { stages.push_back(stage); });
  }

  void serveRelease() {
    http.routeBody(META_URL,
                   releaseJson({{"mineplace3d-linux-x86_64", LINUX_URL},
                                {"mineplace3d-windows-x86_64.exe",
                                 WINDOWS_URL}}));
  }

  void serveBinary(const std::string &url, size_t chunks = 4) {
    FakeRoute r;
    for (size_t i = 0; i < chunks; ++i)
      r.chunks.push_back("chunk" + std::to_string(i) + ";");
    http.route(url, r);
  }

  std::vector<ProgressEvent> events() {
    std::vector<ProgressEvent> out;
    while (auto e = receiver.tryReceive())
      out.push_back(*e);
    return out;
  }
};

} // namespace

TEST_CASE("install streams the linux build and marks it executable") {
  EngineFixture f(linuxX64());
  f.serveRelease();
  f.serveBinary(LINUX_URL);

  Version installed = f.engine.install(Version(1, 2, 3));
  CHECK(installed == Version(1, 2, 3));

  const auto binary = f.root / "game" / "versions" / "1.2.3";
  REQUIRE(fs::exists(binary));
  CHECK(readFile(binary) == "chunk0;chunk1;chunk2;chunk3;");

  auto perms = fs::status(binary).permissions();
  CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
  CHECK((perms & fs::perms::others_exec) != fs::perms::none);
  CHECK((perms & fs::perms::group_write) == fs::perms::none);

  CHECK(f.http.calls() == std::vector<std::string>{META_URL, LINUX_URL});
  CHECK(f.stages ==
        std::vector<DownloadStage>{DownloadStage::FETCHING_METADATA,
                                   DownloadStage::RESOLVING_ASSET,
                                   DownloadStage::STREAMING,
                                   DownloadStage::FINALIZING,
                                   DownloadStage::SUCCEEDED});
}

TEST_CASE("install reports monotonic progress and one FINISHED") {
  EngineFixture f(linuxX64());
  f.serveRelease();
  f.serveBinary(LINUX_URL, 8);

  f.engine.install(Version(1, 2, 3));
  auto events = f.events();
  REQUIRE(events.size() >= 2);

  double last = 0.0;
  size_t finished = 0;
  for (const auto &e : events) {
    if (e.kind == ProgressEvent::Kind::FINISHED) {
      finished++;
      continue;
    }
    CHECK(e.fraction >= last);
    CHECK(e.fraction <= 1.0);
    last = e.fraction;
  }
  CHECK(finished == 1);
  CHECK(events.back().kind == ProgressEvent::Kind::FINISHED);
}

TEST_CASE("a missing release fails before anything touches the disk") {
  EngineFixture f(linuxX64());
  f.http.routeBody(META_URL, R"({"message": "Not Found"})", 404);

  DownloadOutcome outcome = f.engine.run(Version(1, 2, 3));
  CHECK_FALSE(outcome.succeeded());
  CHECK(outcome.requested == Version(1, 2, 3));
  CHECK(outcome.errorKind == ErrorKind::STATUS);
  CHECK(outcome.error.find("not found") != std::string::npos);
  CHECK(outcome.error.find("v1.2.3") != std::string::npos);

  CHECK_FALSE(fs::exists(f.root / "game" / "versions"));
  CHECK(f.http.callCount() == 1);
  CHECK(f.receiver.pending() == 0);
  CHECK(f.stages.back() == DownloadStage::FAILED);
}

TEST_CASE("transport failures while fetching metadata") {
  EngineFixture f(linuxX64());
  FakeRoute r;
  r.failTransport = true;
  f.http.route(META_URL, r);

  auto outcome = f.engine.run(Version(1, 2, 3));
  CHECK(outcome.errorKind == ErrorKind::TRANSPORT);
  CHECK(outcome.error.find("Failed to fetch release info for v1.2.3") == 0);
}

TEST_CASE("a release without a matching asset is a RESOLUTION failure") {
  EngineFixture f(Target{Platform::LINUX, Arch::AARCH64});
  f.serveRelease();

  auto outcome = f.engine.run(Version(1, 2, 3));
  CHECK(outcome.errorKind == ErrorKind::RESOLUTION);
  CHECK(outcome.error.find("No suitable asset found for version v1.2.3") !=
        std::string::npos);
  CHECK(f.http.callCount() == 1);
  CHECK_FALSE(fs::exists(f.root / "game" / "versions"));
}

TEST_CASE("a failing binary download is a STATUS failure") {
  EngineFixture f(linuxX64());
  f.serveRelease();
  FakeRoute r;
  r.status = 500;
  f.http.route(LINUX_URL, r);

  auto outcome = f.engine.run(Version(1, 2, 3));
  CHECK(outcome.errorKind == ErrorKind::STATUS);
  CHECK(outcome.error ==
        "Failed to download asset for version v1.2.3 (HTTP 500)");
  CHECK(f.receiver.pending() == 0);
}

TEST_CASE("the engine refuses to run without a progress sender") {
  TempDir root;
  FakeHttpClient http;
  DownloadEngine engine(http, AssetResolver(REPO, "mineplace3d", linuxX64()),
                        root / "game");

  CHECK_THROWS_AS(engine.install(Version(1, 2, 3)), std::logic_error);

  auto outcome = engine.run(Version(1, 2, 3));
  CHECK(outcome.errorKind == ErrorKind::CONTRACT);
  CHECK(outcome.error == "sender not set");
  CHECK(http.callCount() == 0);
}

TEST_CASE("a retry overwrites the partial file of a failed attempt") {
  EngineFixture f(linuxX64());
  f.serveRelease();
  writeFile(f.root / "game" / "versions" / "1.2.3",
            "partial bytes from an interrupted download that ran long");
  f.serveBinary(LINUX_URL, 2);

  CHECK(f.engine.run(Version(1, 2, 3)).succeeded());
  CHECK(readFile(f.root / "game" / "versions" / "1.2.3") == "chunk0;chunk1;");
}

TEST_CASE("windows installs fetch SDL2.dll after the game binary") {
  EngineFixture f(windowsX64());
  f.serveRelease();
  f.serveBinary(WINDOWS_URL);

  const auto fixture = f.root / "sdl.zip";
  writeZip(fixture, {{"SDL2.dll", "sdl2"}, {"README-SDL.txt", "readme"}});
  f.http.routeBody(DependencyInstaller::SDL2_URL_X86_64, readFile(fixture));

  auto outcome = f.engine.run(Version(1, 2, 3));
  REQUIRE(outcome.succeeded());

  const auto versions = f.root / "game" / "versions";
  CHECK(readFile(versions / "1.2.3.exe") == "chunk0;chunk1;chunk2;chunk3;");
  CHECK(readFile(versions / "SDL2.dll") == "sdl2");
  CHECK_FALSE(fs::exists(versions / "sdl2_temp.zip"));

  CHECK(f.http.calls() ==
        std::vector<std::string>{META_URL, WINDOWS_URL,
                                 DependencyInstaller::SDL2_URL_X86_64});
  CHECK(f.stages ==
        std::vector<DownloadStage>{DownloadStage::FETCHING_METADATA,
                                   DownloadStage::RESOLVING_ASSET,
                                   DownloadStage::STREAMING,
                                   DownloadStage::INSTALLING_DEPENDENCY,
                                   DownloadStage::FINALIZING,
                                   DownloadStage::SUCCEEDED});

  // The dependency download is silent: exactly one FINISHED overall
  size_t finished = 0;
  for (const auto &e : f.events())
    if (e.kind == ProgressEvent::Kind::FINISHED)
      finished++;
  CHECK(finished == 1);
}

TEST_CASE("windows installs skip SDL2 when it is already present") {
  EngineFixture f(windowsX64());
  f.serveRelease();
  f.serveBinary(WINDOWS_URL);
  writeFile(f.root / "game" / "versions" / "SDL2.dll", "existing");

  CHECK(f.engine.run(Version(1, 2, 3)).succeeded());
  CHECK(f.http.callCount(DependencyInstaller::SDL2_URL_X86_64) == 0);
  CHECK(readFile(f.root / "game" / "versions" / "SDL2.dll") == "existing");
}

TEST_CASE("a broken SDL2 bundle fails the install but keeps the binary") {
  EngineFixture f(windowsX64());
  f.serveRelease();
  f.serveBinary(WINDOWS_URL);

  const auto fixture = f.root / "sdl.zip";
  writeZip(fixture, {{"README-SDL.txt", "readme"}});
  f.http.routeBody(DependencyInstaller::SDL2_URL_X86_64, readFile(fixture));

  auto outcome = f.engine.run(Version(1, 2, 3));
  CHECK_FALSE(outcome.succeeded());
  CHECK(outcome.errorKind == ErrorKind::ARCHIVE);
  CHECK(outcome.error.find("Failed to install SDL2.dll for v1.2.3") == 0);
  CHECK(fs::exists(f.root / "game" / "versions" / "1.2.3.exe"));
}

TEST_CASE("stage and error kind names") {
  CHECK(downloadStageName(DownloadStage::STREAMING) == "Streaming");
  CHECK(downloadStageName(DownloadStage::INSTALLING_DEPENDENCY) ==
        "Installing dependency");
  CHECK(errorKindName(ErrorKind::STATUS) == "status");
}
