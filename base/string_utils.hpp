#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace strings
{
using UniChar = char32_t;
using UniString = std::u32string;

UniString MakeUniString(std::string const & utf8s);
std::string ToUtf8(UniString const & s);

// Unicode white space as understood by most scripting languages, including the
// ideographic space U+3000 which is common in Chinese addresses.
bool IsSpace(UniChar c);

bool StartsWith(std::string const & s1, std::string const & s2);

/// Splits |str| by Unicode white space, empty tokens are skipped.
std::vector<UniString> TokenizeBySpaces(UniString const & str);

template <typename Container>
std::string JoinStrings(Container const & container, std::string const & delimiter)
{
  std::ostringstream out;
  bool first = true;
  for (auto const & item : container)
  {
    if (!first)
      out << delimiter;
    out << item;
    first = false;
  }
  return out.str();
}

/// The whole string must be consumed, infinities and NaNs are rejected.
bool to_double(std::string const & s, double & d);
}  // namespace strings
