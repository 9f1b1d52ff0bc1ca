#include "base/logging.hpp"

#include "base/assert.hpp"
#include "base/timer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace base
{
namespace
{
std::mutex g_logMutex;

double ElapsedSecondsSinceStart()
{
  static Timer const timer;
  return timer.ElapsedSeconds();
}
}  // namespace

std::string ToString(LogLevel level)
{
  auto const & names = GetLogLevelNames();
  CHECK_LESS(static_cast<size_t>(level), names.size(), ());
  return names[level];
}

bool FromString(std::string const & s, LogLevel & level)
{
  auto const & names = GetLogLevelNames();
  auto it = std::find(names.begin(), names.end(), s);
  if (it == names.end())
    return false;
  level = static_cast<LogLevel>(std::distance(names.begin(), it));
  return true;
}

std::vector<std::string> const & GetLogLevelNames()
{
  static std::vector<std::string> const kNames = {
      {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}};
  return kNames;
}

void LogMessageDefault(LogLevel level, SrcPoint const & srcPoint, std::string const & msg)
{
  std::lock_guard<std::mutex> lock(g_logMutex);

  std::ostringstream out;
  out << ToString(level) << " " << std::fixed << std::setprecision(5)
      << ElapsedSecondsSinceStart() << " " << DebugPrint(srcPoint) << msg << std::endl;
  std::cerr << out.str();
}

void LogMessageTests(LogLevel level, SrcPoint const &, std::string const & msg)
{
  std::lock_guard<std::mutex> lock(g_logMutex);

  std::ostringstream out;
  out << msg << std::endl;
  std::cerr << out.str();
}

LogLevel GetDefaultLogLevel()
{
#if defined(DEBUG)
  return LDEBUG;
#else
  return LINFO;
#endif
}

LogMessageFn LogMessage = &LogMessageDefault;

AtomicLogLevel g_LogLevel = {GetDefaultLogLevel()};

LogMessageFn SetLogMessageFn(LogMessageFn fn)
{
  std::swap(LogMessage, fn);
  return fn;
}
}  // namespace base
