#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

/// @name Declarations.
//@{
template <typename T> inline std::string DebugPrint(T const & t);

inline std::string DebugPrint(std::string const & t);
inline std::string DebugPrint(char const * t);
inline std::string DebugPrint(char t);
inline std::string DebugPrint(bool t);

template <typename U, typename V>
inline std::string DebugPrint(std::pair<U, V> const & p);
template <typename T>
inline std::string DebugPrint(std::vector<T> const & v);
template <typename K, typename V>
inline std::string DebugPrint(std::map<K, V> const & v);
template <typename T>
inline std::string DebugPrint(boost::optional<T> const & p);
//@}

inline std::string DebugPrint(std::string const & t) { return t; }

inline std::string DebugPrint(char const * t)
{
  if (t)
    return std::string(t);
  return std::string("NULL string pointer");
}

inline std::string DebugPrint(char t) { return std::string(1, t); }

inline std::string DebugPrint(bool t) { return t ? "true" : "false"; }

// Prints a number instead of a character.
inline std::string DebugPrint(signed char t) { return DebugPrint(static_cast<int>(t)); }
inline std::string DebugPrint(unsigned char t) { return DebugPrint(static_cast<unsigned int>(t)); }

template <typename U, typename V>
inline std::string DebugPrint(std::pair<U, V> const & p)
{
  std::ostringstream out;
  out << "(" << DebugPrint(p.first) << ", " << DebugPrint(p.second) << ")";
  return out.str();
}

namespace base
{
namespace internal
{
template <typename It>
std::string DebugPrintSequence(It beg, It end)
{
  std::ostringstream out;
  out << "[";
  for (auto it = beg; it != end; ++it)
  {
    if (it != beg)
      out << ", ";
    out << DebugPrint(*it);
  }
  out << "]";
  return out.str();
}
}  // namespace internal
}  // namespace base

template <typename T>
inline std::string DebugPrint(std::vector<T> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename K, typename V>
inline std::string DebugPrint(std::map<K, V> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T>
inline std::string DebugPrint(boost::optional<T> const & p)
{
  if (p)
    return "optional(" + DebugPrint(*p) + ")";
  return "none";
}

template <typename T>
inline std::string DebugPrint(T const & t)
{
  std::ostringstream out;
  out << t;
  return out.str();
}

namespace base
{
inline std::string Message() { return std::string(); }

template <typename T>
std::string Message(T const & t)
{
  using ::DebugPrint;
  return DebugPrint(t);
}

template <typename T, typename... Args>
std::string Message(T const & t, Args const &... others)
{
  using ::DebugPrint;
  return DebugPrint(t) + " " + Message(others...);
}
}  // namespace base
