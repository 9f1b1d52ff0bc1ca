#pragma once

#include <ctime>
#include <string>

namespace base
{
// A cross-platform (and thread-safe) version of gmtime.
std::tm GmTime(time_t const time);

// Current UTC time as "YYYY-MM-DD HH:MM:SS".
std::string GmTimeNowString();
}  // namespace base
