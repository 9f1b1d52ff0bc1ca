#pragma once

#include <chrono>
#include <cstdint>

namespace base
{
/// Cross platform timer
class Timer
{
  std::chrono::steady_clock::time_point m_startTime;

public:
  explicit Timer(bool start = true);

  void Reset() { m_startTime = std::chrono::steady_clock::now(); }

  std::chrono::steady_clock::duration TimeElapsed() const
  {
    return std::chrono::steady_clock::now() - m_startTime;
  }

  template <typename Duration>
  Duration TimeElapsedAs() const
  {
    return std::chrono::duration_cast<Duration>(TimeElapsed());
  }

  double ElapsedSeconds() const { return TimeElapsedAs<std::chrono::duration<double>>().count(); }
  uint64_t ElapsedMilliseconds() const
  {
    return static_cast<uint64_t>(TimeElapsedAs<std::chrono::milliseconds>().count());
  }
};
}  // namespace base
