#include "core/service/clock.hpp"

#include <thread>

namespace veg21 {

Timestamp SystemClock::now() const {
  return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

ManualClock::ManualClock(Timestamp start) : now_(start) {}

Timestamp ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::sleep_for(std::chrono::milliseconds duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  slept_ += duration;
}

void ManualClock::advance(std::chrono::nanoseconds duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += std::chrono::duration_cast<Timestamp::duration>(duration);
}

void ManualClock::set(Timestamp ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = ts;
}

std::chrono::milliseconds ManualClock::total_slept() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slept_;
}

std::shared_ptr<IClock> make_system_clock() {
  return std::make_shared<SystemClock>();
}

}  // namespace veg21
