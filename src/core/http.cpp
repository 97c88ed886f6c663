#include "mplaunch/http.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/logger.hpp"
#include <curl/curl.h>
#include <exception>
#include <memory>
#include <mutex>

namespace mplaunch {

namespace {

struct CurlDeleter {
  void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct StreamContext {
  CURL *curl = nullptr;
  ChunkSink *sink = nullptr;
};

CurlHandle makeHandle(const std::string &url, const std::string &userAgent,
                      long connectTimeoutSecs) {
  static std::once_flag globalInit;
  std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  CurlHandle curl(curl_easy_init());
  if (!curl)
    throw Error(ErrorKind::TRANSPORT, "Failed to initialize cURL");

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connectTimeoutSecs);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  return curl;
}

} // namespace

void ChunkSink::begin(long status, int64_t contentLength) {
  started_ = true;
  discard_ = status < 200 || status >= 300;
  if (contentLength >= 0)
    totalLength_ = static_cast<uint64_t>(contentLength);
  else
    totalLength_.reset();
}

size_t ChunkSink::write(const char *data, size_t size) {
  if (error_)
    return 0;
  if (discard_)
    return size;

  // Exceptions must not cross the transport's C frames. Park it and abort.
  try {
    onChunk_(data, size, totalLength_);
  } catch (...) {
    error_ = std::current_exception();
    return 0;
  }
  return size;
}

void ChunkSink::rethrowIfFailed() const {
  if (error_)
    std::rethrow_exception(error_);
}

CurlHttpClient::CurlHttpClient(const std::string &userAgent,
                               long connectTimeoutSecs)
    : userAgent_(userAgent), connectTimeoutSecs_(connectTimeoutSecs) {}

CurlHttpClient::~CurlHttpClient() = default;

size_t CurlHttpClient::writeCallback(void *contents, size_t size, size_t nmemb,
                                     void *userp) {
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            size * nmemb);
  return size * nmemb;
}

size_t CurlHttpClient::streamCallback(void *contents, size_t size,
                                      size_t nmemb, void *userp) {
  auto *ctx = static_cast<StreamContext *>(userp);

  if (!ctx->sink->started()) {
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    curl_off_t length = -1;
    if (curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                          &length) != CURLE_OK)
      length = -1;
    ctx->sink->begin(status, static_cast<int64_t>(length));
  }

  return ctx->sink->write(static_cast<const char *>(contents), size * nmemb);
}

HttpResponse CurlHttpClient::get(const std::string &url) {
  CurlHandle curl = makeHandle(url, userAgent_, connectTimeoutSecs_);

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw Error(ErrorKind::TRANSPORT,
                "cURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  LOG_DEBUG("GET " + url + " -> " + std::to_string(response.status));
  return response;
}

long CurlHttpClient::stream(const std::string &url,
                            const ChunkCallback &onChunk) {
  CurlHandle curl = makeHandle(url, userAgent_, connectTimeoutSecs_);

  ChunkSink sink(onChunk);
  StreamContext ctx;
  ctx.curl = curl.get();
  ctx.sink = &sink;
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, streamCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

  CURLcode res = curl_easy_perform(curl.get());
  sink.rethrowIfFailed();
  if (res != CURLE_OK) {
    throw Error(ErrorKind::TRANSPORT,
                "cURL transfer failed: " + std::string(curl_easy_strerror(res)));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  LOG_DEBUG("STREAM " + url + " -> " + std::to_string(status));
  return status;
}

} // namespace mplaunch
