#ifndef JOBDL_TRANSPORT_HPP_
#define JOBDL_TRANSPORT_HPP_

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace jobdl {

struct StreamEvent {
  enum class Kind {
    kHeaders,    // response metadata, delivered once before any chunk
    kChunk,      // next slice of the body
    kEnd,        // body complete
    kHttpError,  // server answered with a non-success status
    kError       // transport failure
  };

  Kind kind = Kind::kEnd;
  uint64_t contentLength = 0;  // kHeaders, 0 if unknown
  long httpStatus = 0;         // kHeaders, kHttpError
  std::string data;            // kChunk
  std::string reason;          // kError

  static StreamEvent headers(uint64_t length, long status = 200) {
    StreamEvent ev;
    ev.kind = Kind::kHeaders;
    ev.contentLength = length;
    ev.httpStatus = status;
    return ev;
  }
  static StreamEvent chunk(std::string bytes) {
    StreamEvent ev;
    ev.kind = Kind::kChunk;
    ev.data = std::move(bytes);
    return ev;
  }
  static StreamEvent end() { return StreamEvent(); }
  static StreamEvent httpError(long status) {
    StreamEvent ev;
    ev.kind = Kind::kHttpError;
    ev.httpStatus = status;
    return ev;
  }
  static StreamEvent error(std::string why) {
    StreamEvent ev;
    ev.kind = Kind::kError;
    ev.reason = std::move(why);
    return ev;
  }
};

// Pull-based body stream: nothing past the returned event is fetched until
// next() is called again. Terminal events (kEnd, kHttpError, kError) repeat
// on further calls.
class Stream {
 public:
  virtual ~Stream() = default;

  virtual StreamEvent next() = 0;
  // Thread-safe. Makes a blocked or future next() return kError promptly.
  virtual void interrupt() noexcept = 0;
};

class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Transport {
 public:
  virtual ~Transport() = default;

  // Throws TransportError when the stream cannot be set up (malformed URL,
  // unsupported scheme, resource exhaustion).
  virtual std::unique_ptr<Stream> open(const std::string& url) = 0;
};

}  // namespace jobdl

#endif  // JOBDL_TRANSPORT_HPP_
