#include "mplaunch/stream_downloader.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace mplaunch {

StreamDownloader::StreamDownloader(HttpClient &http,
                                   std::chrono::milliseconds interval)
    : http_(http), interval_(interval),
      clock_([] { return std::chrono::steady_clock::now(); }) {}

uint64_t StreamDownloader::download(const std::string &url,
                                    const std::filesystem::path &dest,
                                    const std::string &label,
                                    const ProgressSender *progress) {
  std::ofstream ofs(dest, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw Error(ErrorKind::IO, "Failed to create file for " + label + " at " +
                                   dest.string() + ": " +
                                   std::strerror(errno));
  }

  uint64_t downloaded = 0;
  uint64_t windowBytes = 0;
  auto windowStart = clock_();

  auto onChunk = [&](const char *data, size_t size,
                     std::optional<uint64_t> total) {
    ofs.write(data, static_cast<std::streamsize>(size));
    if (!ofs) {
      throw Error(ErrorKind::IO, "Failed to write " + label + " to " +
                                     dest.string() + ": " +
                                     std::strerror(errno));
    }

    downloaded += size;
    windowBytes += size;

    if (!progress || !total || *total == 0)
      return;

    auto now = clock_();
    auto elapsed = now - windowStart;
    if (elapsed < interval_ || elapsed.count() <= 0)
      return;

    double seconds = std::chrono::duration<double>(elapsed).count();
    double fraction = std::min(
        1.0, static_cast<double>(downloaded) / static_cast<double>(*total));
    double speed = static_cast<double>(windowBytes) / seconds;
    if (!progress->trySend(ProgressEvent::progress(fraction, speed)))
      LOG_DEBUG("Progress channel full, sample dropped");

    windowBytes = 0;
    windowStart = now;
  };

  long status = 0;
  try {
    status = http_.stream(url, onChunk);
  } catch (const Error &e) {
    if (e.kind() != ErrorKind::TRANSPORT)
      throw;
    throw Error(ErrorKind::TRANSPORT,
                "Failed to download " + label + ": " + e.what());
  }

  if (status < 200 || status >= 300) {
    throw Error(ErrorKind::STATUS, "Failed to download " + label +
                                       " (HTTP " + std::to_string(status) +
                                       ")");
  }

  ofs.close();
  if (!ofs) {
    throw Error(ErrorKind::IO,
                "Failed to flush " + label + " to " + dest.string());
  }

  if (progress)
    progress->trySend(ProgressEvent::finished());

  LOG_INFO("Downloaded " + label + " (" + std::to_string(downloaded) +
           " bytes) to " + dest.string());
  return downloaded;
}

} // namespace mplaunch
