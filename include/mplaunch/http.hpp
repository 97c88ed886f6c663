#ifndef MPLAUNCH_HTTP_HPP
#define MPLAUNCH_HTTP_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>

namespace mplaunch {

struct HttpResponse {
  long status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// Called once per received body chunk. totalLength is the Content-Length
// announced by the server, if any. Exceptions thrown from here abort the
// transfer and propagate out of HttpClient::stream().
using ChunkCallback = std::function<void(
    const char *data, size_t size, std::optional<uint64_t> totalLength)>;

// Transport seam between the download engine and the network. Transport
// failures throw Error(TRANSPORT); HTTP error statuses are returned, not
// thrown.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string &url) = 0;

  // Streams the body through onChunk without buffering it. When the status
  // is not 2xx the body is discarded and onChunk is never called.
  virtual long stream(const std::string &url, const ChunkCallback &onChunk) = 0;
};

// Per-transfer bookkeeping for a streaming GET, independent of the transport.
// begin() fixes the status and announced length before the first chunk. A
// non-2xx body is consumed without reaching the handler. An exception from
// the handler is parked and the transfer told to abort.
class ChunkSink {
public:
  explicit ChunkSink(const ChunkCallback &onChunk) : onChunk_(onChunk) {}

  bool started() const { return started_; }

  // contentLength < 0 means the server announced none.
  void begin(long status, int64_t contentLength);

  // Returns size to continue, 0 to abort the transfer.
  size_t write(const char *data, size_t size);

  // Rethrows the parked handler exception, if any.
  void rethrowIfFailed() const;

  bool discarding() const { return discard_; }
  std::optional<uint64_t> totalLength() const { return totalLength_; }

private:
  const ChunkCallback &onChunk_;
  bool started_ = false;
  bool discard_ = false;
  std::optional<uint64_t> totalLength_;
  std::exception_ptr error_;
};

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient(const std::string &userAgent, long connectTimeoutSecs = 30);
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  HttpResponse get(const std::string &url) override;
  long stream(const std::string &url, const ChunkCallback &onChunk) override;

private:
  std::string userAgent_;
  long connectTimeoutSecs_;

  static size_t writeCallback(void *contents, size_t size, size_t nmemb,
                              void *userp);
  static size_t streamCallback(void *contents, size_t size, size_t nmemb,
                               void *userp);
};

} // namespace mplaunch

#endif // MPLAUNCH_HTTP_HPP
