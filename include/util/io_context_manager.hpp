#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace carrierctrl {

// Owns the io_context that runs timers and strands, plus the threads driving
// it. The work guard keeps the threads alive while nothing is queued.
class IoContextManager {
public:
  explicit IoContextManager(std::size_t threads_num = 1)
      : work_guard_(boost::asio::make_work_guard(ioc_)) {
    if (threads_num == 0) {
      threads_num = 1;
    }
    threads_.reserve(threads_num);
    for (std::size_t i = 0; i < threads_num; ++i) {
      threads_.emplace_back([this]() { ioc_.run(); });
    }
  }

  ~IoContextManager() { stop(); }

  IoContextManager(const IoContextManager &) = delete;
  IoContextManager &operator=(const IoContextManager &) = delete;

  boost::asio::io_context &ioc() { return ioc_; }

  void stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    work_guard_.reset();
    ioc_.stop();
    for (auto &t : threads_) {
      if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
        t.join();
      } else if (t.joinable()) {
        t.detach();
      }
    }
  }

private:
  boost::asio::io_context ioc_;
  std::optional<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> threads_;
  std::mutex stop_mutex_;
  bool stopped_{false};
};

} // namespace carrierctrl
