#ifndef MPLAUNCH_STREAM_DOWNLOADER_HPP
#define MPLAUNCH_STREAM_DOWNLOADER_HPP

#include "mplaunch/http.hpp"
#include "mplaunch/progress_channel.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace mplaunch {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

// Streams one URL to one file, chunk by chunk, sampling throughput on a fixed
// cadence. Shared by the game download and the SDL2 sub-download.
class StreamDownloader {
public:
  explicit StreamDownloader(
      HttpClient &http,
      std::chrono::milliseconds interval = std::chrono::milliseconds(250));

  // Replaces std::chrono::steady_clock::now, for tests.
  void setClock(SteadyClock clock) { clock_ = std::move(clock); }
  void setInterval(std::chrono::milliseconds interval) { interval_ = interval; }

  // Truncates dest, then appends every chunk. When progress is given, emits
  // PROGRESS samples while the content length is known and one FINISHED at
  // the end. label names the payload in error messages.
  // Throws Error(STATUS | TRANSPORT | IO). A partial file is left in place.
  uint64_t download(const std::string &url, const std::filesystem::path &dest,
                    const std::string &label,
                    const ProgressSender *progress = nullptr);

private:
  HttpClient &http_;
  std::chrono::milliseconds interval_;
  SteadyClock clock_;
};

} // namespace mplaunch

#endif // MPLAUNCH_STREAM_DOWNLOADER_HPP
