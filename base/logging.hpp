#pragma once

#include "base/internal/message.hpp"
#include "base/src_point.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace base
{
enum LogLevel
{
  LDEBUG,
  LINFO,
  LWARNING,
  LERROR,
  LCRITICAL,

  NUM_LOG_LEVELS
};

std::string ToString(LogLevel level);
bool FromString(std::string const & s, LogLevel & level);
std::vector<std::string> const & GetLogLevelNames();

using AtomicLogLevel = std::atomic<LogLevel>;
using LogMessageFn = void (*)(LogLevel level, SrcPoint const &, std::string const &);

LogLevel GetDefaultLogLevel();

extern LogMessageFn LogMessage;
extern AtomicLogLevel g_LogLevel;

/// @return Pointer to previous message function.
LogMessageFn SetLogMessageFn(LogMessageFn fn);

void LogMessageDefault(LogLevel level, SrcPoint const & srcPoint, std::string const & msg);
void LogMessageTests(LogLevel level, SrcPoint const & srcPoint, std::string const & msg);

// Scope guard to temporarily suppress a specific log level, for example, in unit tests:
// ...
// {
//   ScopedLogLevelChanger onlyLERRORAndLCriticalLogsAreEnabled(LERROR);
//   TEST(SomeFunctionWhichHasDebugOrInfoOrWarningLogs(), ());
// }
struct ScopedLogLevelChanger
{
  explicit ScopedLogLevelChanger(LogLevel temporaryLogLevel = LERROR) { g_LogLevel = temporaryLogLevel; }

  ~ScopedLogLevelChanger() { g_LogLevel = m_old; }

  LogLevel m_old = g_LogLevel;
};
}  // namespace base

using base::LDEBUG;
using base::LINFO;
using base::LWARNING;
using base::LERROR;
using base::LCRITICAL;
using base::NUM_LOG_LEVELS;

// Logging macro.
// Example usage: LOG(LINFO, (Calc(), m_i, "Small string", 5, "Hello", 7.2));
#define LOG(level, msg)                                        \
  do                                                           \
  {                                                            \
    if ((level) >= ::base::g_LogLevel)                         \
      ::base::LogMessage(level, SRC(), ::base::Message msg);   \
  } while (false)
