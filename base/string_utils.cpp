#include "base/string_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

#include <boost/locale/encoding_utf.hpp>

namespace strings
{
UniString MakeUniString(std::string const & utf8s)
{
  return boost::locale::conv::utf_to_utf<UniChar>(utf8s);
}

std::string ToUtf8(UniString const & s)
{
  return boost::locale::conv::utf_to_utf<char>(s);
}

bool IsSpace(UniChar c)
{
  switch (c)
  {
  case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D:
  case 0x1C: case 0x1D: case 0x1E: case 0x1F: case 0x20:
  case 0x85: case 0xA0: case 0x1680:
  case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
    return true;
  }
  return c >= 0x2000 && c <= 0x200A;
}

bool StartsWith(std::string const & s1, std::string const & s2)
{
  return s1.compare(0, s2.length(), s2) == 0;
}

std::vector<UniString> TokenizeBySpaces(UniString const & str)
{
  std::vector<UniString> tokens;
  UniString token;
  for (UniChar const c : str)
  {
    if (IsSpace(c))
    {
      if (!token.empty())
        tokens.push_back(std::move(token));
      token.clear();
      continue;
    }
    token.push_back(c);
  }
  if (!token.empty())
    tokens.push_back(std::move(token));
  return tokens;
}

bool to_double(std::string const & s, double & d)
{
  char * stop;
  char const * start = s.c_str();
  errno = 0;
  double const x = std::strtod(start, &stop);
  if (errno == ERANGE || *stop != 0 || start == stop || !std::isfinite(x))
    return false;
  d = x;
  return true;
}
}  // namespace strings
