#include "base/gmtime.hpp"

#include <array>

namespace base
{
std::tm GmTime(time_t const time)
{
  std::tm result{};
  gmtime_r(&time, &result);

  return result;
}

std::string GmTimeNowString()
{
  std::tm const tm = GmTime(std::time(nullptr));
  std::array<char, 32> buffer{};
  auto const length = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buffer.data(), length);
}
}  // namespace base
