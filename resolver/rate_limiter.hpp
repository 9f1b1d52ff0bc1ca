#pragma once

#include "base/exception.hpp"
#include "base/macros.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace resolver
{
// Leaky bucket admitting at most |rateLimit| operations per second.
// A background thread refills the bucket; the bucket is small
// (see GetCapacity()) so that a steady rate is enforced instead of bursts.
//
// Thread-safety: YES.
class RateLimiter
{
public:
  DECLARE_EXCEPTION(Exception, RootException);
  DECLARE_EXCEPTION(ConfigException, Exception);
  DECLARE_EXCEPTION(ClosedException, Exception);

  using Clock = std::chrono::steady_clock;

  // Minimal pause between two refills, bounds CPU usage at high rates.
  static Clock::duration const kMinSleep;

  // Throws ConfigException if |rateLimit| is not a positive finite number.
  explicit RateLimiter(double rateLimit);
  ~RateLimiter();

  // Blocks until a token is available and consumes it.
  // Throws ClosedException if the limiter is closed before or while waiting.
  void Acquire();

  // Stops the refill thread and wakes up all waiters. Idempotent.
  void Close();

  size_t GetCapacity() const { return m_capacity; }
  Clock::duration GetRefillPeriod() const { return m_refillPeriod; }

  static size_t CapacityFor(double rateLimit);

private:
  void Fill();

  double const m_rateLimit;
  size_t const m_capacity;
  Clock::duration const m_refillPeriod;

  std::mutex m_mutex;
  std::condition_variable m_tokenAdded;
  std::condition_variable m_closing;
  size_t m_tokens = 0;
  bool m_closed = false;

  std::thread m_filler;

  DISALLOW_COPY_AND_MOVE(RateLimiter);
};
}  // namespace resolver
