#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "core/model/types.hpp"

namespace veg21 {

class IClock {
public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual Timestamp now() const = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] Timestamp now() const override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

// Time only moves when advance() or set() is called. sleep_for() returns at
// once so simulated confirmation delays cost nothing.
class ManualClock final : public IClock {
public:
  explicit ManualClock(Timestamp start = Timestamp{std::chrono::hours{24 * 365 * 50}});

  [[nodiscard]] Timestamp now() const override;
  void sleep_for(std::chrono::milliseconds duration) override;

  void advance(std::chrono::nanoseconds duration);
  void set(Timestamp ts);
  [[nodiscard]] std::chrono::milliseconds total_slept() const;

private:
  mutable std::mutex mutex_;
  Timestamp now_;
  std::chrono::milliseconds slept_{0};
};

std::shared_ptr<IClock> make_system_clock();

}  // namespace veg21
