#include "base/timer.hpp"

namespace base
{
Timer::Timer(bool start /* = true */)
{
  if (start)
    Reset();
}
}  // namespace base
