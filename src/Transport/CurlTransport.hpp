#ifndef JOBDL_CURL_TRANSPORT_HPP_
#define JOBDL_CURL_TRANSPORT_HPP_

#include <chrono>
#include <memory>
#include <string>

#include "Transport.hpp"

namespace jobdl {

struct CurlOptions {
  std::chrono::milliseconds connectTimeout{10000};
  long lowSpeedTimeSeconds = 30;
  long maxRedirects = 10;

  static CurlOptions FromFlags();
};

// Calls curl_global_init once per process.
void ensureCurlInitialized();

class CurlTransport final : public Transport {
 public:
  explicit CurlTransport(CurlOptions options = CurlOptions());

  std::unique_ptr<Stream> open(const std::string& url) override;

 private:
  CurlOptions options_;
};

}  // namespace jobdl

#endif  // JOBDL_CURL_TRANSPORT_HPP_
