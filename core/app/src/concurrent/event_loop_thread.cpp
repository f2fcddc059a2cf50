#include "tradecore/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace tradecore {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWait = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): pop with timeout, publish, repeat until stop()
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWait);
    if (!event) {
      continue;
    }
    try {
      bus_.publish(*event);
    } catch (const std::exception& e) {
      // A throwing subscriber must not take the whole loop down.
      std::cerr << "[" << name_ << "] ERROR: subscriber threw: " << e.what()
                << "\n";
    }
  }
}

}  // namespace tradecore
