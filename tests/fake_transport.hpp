#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Transport/Transport.hpp"

namespace jobdl::fakes {

// What a scripted URL serves. With holdAt set, next() blocks before
// delivering event #holdAt until release() or interrupt().
struct Script {
  std::vector<StreamEvent> events;
  std::size_t holdAt = std::numeric_limits<std::size_t>::max();
  bool failOpen = false;
};

inline Script servesBytes(const std::string& body, std::size_t chunkSize,
                          bool advertiseLength = true) {
  Script script;
  script.events.push_back(
      StreamEvent::headers(advertiseLength ? body.size() : 0));
  for (std::size_t pos = 0; pos < body.size(); pos += chunkSize) {
    script.events.push_back(StreamEvent::chunk(body.substr(pos, chunkSize)));
  }
  script.events.push_back(StreamEvent::end());
  return script;
}

inline Script notFound() {
  Script script;
  script.events.push_back(StreamEvent::httpError(404));
  return script;
}

class FakeTransport : public Transport {
 public:
  void serve(const std::string& url, Script script) {
    std::lock_guard<std::mutex> lock(gate_->mutex);
    scripts_[url] = std::move(script);
  }

  void release() {
    std::lock_guard<std::mutex> lock(gate_->mutex);
    gate_->released = true;
    gate_->cv.notify_all();
  }

  int opened() const { return opened_.load(); }

  std::unique_ptr<Stream> open(const std::string& url) override {
    Script script;
    {
      std::lock_guard<std::mutex> lock(gate_->mutex);
      auto it = scripts_.find(url);
      if (it == scripts_.end()) {
        throw TransportError("No route to " + url);
      }
      script = it->second;
    }
    if (script.failOpen) {
      throw TransportError("Malformed URL '" + url + "'");
    }
    ++opened_;
    return std::make_unique<ScriptedStream>(std::move(script), gate_);
  }

 private:
  struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
  };

  class ScriptedStream : public Stream {
   public:
    ScriptedStream(Script script, std::shared_ptr<Gate> gate)
        : script_(std::move(script)), gate_(std::move(gate)) {}

    StreamEvent next() override {
      if (next_ == script_.holdAt) {
        std::unique_lock<std::mutex> lock(gate_->mutex);
        gate_->cv.wait(lock, [this] {
          return gate_->released || interrupted_.load();
        });
      }
      if (interrupted_.load()) {
        return StreamEvent::error("interrupted");
      }
      if (next_ >= script_.events.size()) {
        return script_.events.empty() ? StreamEvent::end()
                                      : script_.events.back();
      }
      return script_.events[next_++];
    }

    void interrupt() noexcept override {
      std::lock_guard<std::mutex> lock(gate_->mutex);
      interrupted_.store(true);
      gate_->cv.notify_all();
    }

   private:
    Script script_;
    std::shared_ptr<Gate> gate_;
    std::size_t next_ = 0;
    std::atomic<bool> interrupted_{false};
  };

  std::shared_ptr<Gate> gate_ = std::make_shared<Gate>();
  std::map<std::string, Script> scripts_;
  std::atomic<int> opened_{0};
};

}  // namespace jobdl::fakes
