#include "CurlTransport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "utils/flags.hpp"
#include "utils/logger.hpp"

namespace jobdl {

namespace {

constexpr int kPollTimeoutMs = 100;

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// Rejects what curl cannot parse as well as schemes we do not download from.
void validateUrl(const std::string& url) {
  UrlHandle handle{curl_url(), &curl_url_cleanup};
  if (!handle) {
    throw TransportError("Failed to allocate URL handle");
  }
  CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
  if (rc != CURLUE_OK) {
    throw TransportError("Malformed URL '" + url + "'");
  }

  char* scheme = nullptr;
  rc = curl_url_get(handle.get(), CURLUPART_SCHEME, &scheme, 0);
  std::string value = (rc == CURLUE_OK && scheme) ? scheme : "";
  curl_free(scheme);
  if (value != "http" && value != "https") {
    throw TransportError("Unsupported URL scheme '" + value + "'");
  }
}

class CurlStream final : public Stream {
 public:
  CurlStream(const std::string& url, const CurlOptions& options)
      : multi_(curl_multi_init(), &curl_multi_cleanup),
        easy_(curl_easy_init(), &curl_easy_cleanup) {
    errorBuffer_[0] = '\0';
    if (!multi_ || !easy_) {
      throw TransportError("Failed to allocate curl handle");
    }

    CURL* curl = easy_.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlStream::onBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.maxRedirects);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options.lowSpeedTimeSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);

    CURLMcode mc = curl_multi_add_handle(multi_.get(), curl);
    if (mc != CURLM_OK) {
      throw TransportError(std::string{"curl multi error: "} +
                           curl_multi_strerror(mc));
    }
  }

  ~CurlStream() override {
    curl_multi_remove_handle(multi_.get(), easy_.get());
  }

  StreamEvent next() override {
    if (terminal_) return *terminal_;

    while (pending_.empty() && !transferDone_) {
      if (interrupted_.load()) {
        return finish(StreamEvent::error("interrupted"));
      }
      pump();
    }

    if (!headersDelivered_) {
      headersDelivered_ = true;
      if (pending_.empty() && result_ != CURLE_OK) {
        return finish(StreamEvent::error(describeFailure()));
      }

      long code = 0;
      curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
      if (code < 200 || code >= 300) {
        return finish(StreamEvent::httpError(code));
      }

      curl_off_t length = -1;
      curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                        &length);
      //没有 Content-Length 时返回 -1
      return StreamEvent::headers(
          static_cast<uint64_t>(std::max<curl_off_t>(0, length)), code);
    }

    if (!pending_.empty()) {
      std::string bytes = std::move(pending_.front());
      pending_.pop_front();
      return StreamEvent::chunk(std::move(bytes));
    }

    if (result_ != CURLE_OK) {
      return finish(StreamEvent::error(describeFailure()));
    }
    return finish(StreamEvent::end());
  }

  void interrupt() noexcept override {
    interrupted_.store(true);
    curl_multi_wakeup(multi_.get());
  }

 private:
  static size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlStream*>(userdata);
    const size_t total = size * nmemb;
    if (!self || total == 0) {
      return total;
    }
    self->pending_.emplace_back(ptr, total);
    return total;
  }

  // Drives the transfer only until something is buffered for the consumer.
  void pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_.get(), &running);
    if (mc != CURLM_OK) {
      failMulti(mc);
      return;
    }

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
      if (msg->msg == CURLMSG_DONE) {
        transferDone_ = true;
        result_ = msg->data.result;
      }
    }

    if (!transferDone_ && pending_.empty()) {
      mc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
      if (mc != CURLM_OK) {
        failMulti(mc);
      }
    }
  }

  void failMulti(CURLMcode mc) {
    transferDone_ = true;
    result_ = CURLE_RECV_ERROR;
    multiError_ = std::string{"curl multi error: "} + curl_multi_strerror(mc);
  }

  std::string describeFailure() const {
    if (!multiError_.empty()) return multiError_;
    if (errorBuffer_[0] != '\0') {
      return std::string{"curl error: "} + errorBuffer_;
    }
    return std::string{"curl error: "} + curl_easy_strerror(result_);
  }

  StreamEvent finish(StreamEvent ev) {
    terminal_ = ev;
    return ev;
  }

  using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
  using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

  MultiHandle multi_;
  EasyHandle easy_;
  char errorBuffer_[CURL_ERROR_SIZE];

  std::deque<std::string> pending_;
  bool headersDelivered_ = false;
  bool transferDone_ = false;
  CURLcode result_ = CURLE_OK;
  std::string multiError_;
  std::optional<StreamEvent> terminal_;
  std::atomic<bool> interrupted_{false};
};

}  // namespace

void ensureCurlInitialized() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw TransportError("Failed to initialize libcurl");
    }
    std::atexit([] { curl_global_cleanup(); });
  });
}

CurlOptions CurlOptions::FromFlags() {
  CurlOptions options;
  options.connectTimeout = std::chrono::milliseconds(FLAGS_connect_timeout_ms);
  options.lowSpeedTimeSeconds = FLAGS_low_speed_time_s;
  return options;
}

CurlTransport::CurlTransport(CurlOptions options)
    : options_(std::move(options)) {
  ensureCurlInitialized();
}

std::unique_ptr<Stream> CurlTransport::open(const std::string& url) {
  validateUrl(url);
  LOG(DEBUG) << "Opening stream for " << url;
  return std::make_unique<CurlStream>(url, options_);
}

}  // namespace jobdl
