#pragma once

#include <condition_variable>
#include <mutex>

namespace carrierctrl {

// Parks the main thread until a handler or a signal asks the app to finish.
class Blocker {
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_{false};

public:
  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return stopped_; });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }
};

} // namespace carrierctrl
