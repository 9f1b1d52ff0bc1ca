#include "resolver/address_normalizer.hpp"

#include "base/string_utils.hpp"

#include <algorithm>
#include <regex>

namespace resolver
{
namespace
{
static_assert(sizeof(wchar_t) == sizeof(strings::UniChar),
              "Unicode regular expressions need UTF-32 wchar_t");

// The white space of strings::IsSpace. \s of std::wregex covers ASCII only.
wchar_t const kSpaces[] =
    L"\\s\\u001C-\\u001F\\u0085\\u00A0\\u1680\\u2000-\\u200A\\u2028\\u2029\\u202F\\u205F\\u3000";

// Floors ("3樓", "12層"), shops ("G號舖"), ground floors and basements ("地下",
// "地庫") and podiums ("平台"). The rest of the line is cut without the regex:
// std::regex recurses per matched character.
std::wregex const & FloorRegex()
{
  static std::wregex const kRegex(std::wstring(L"[0-9A-z") + kSpaces + L"\\-]+[樓層]|" +
                                  L"[0-9A-z號" + kSpaces + L"\\-]+[舖鋪]|" +
                                  L"地[下庫]|平台");
  return kRegex;
}
}  // namespace

std::string RemoveFloor(std::string const & address)
{
  auto const uni = strings::MakeUniString(address);
  std::wstring const wide(uni.begin(), uni.end());

  std::wstring result;
  auto it = wide.cbegin();
  std::wsmatch match;
  while (it != wide.cend() && std::regex_search(it, wide.cend(), match, FloorRegex()))
  {
    result.append(it, match[0].first);
    it = std::find(match[0].first, wide.cend(), L'\n');
  }
  result.append(it, wide.cend());

  return strings::ToUtf8(strings::UniString(result.begin(), result.end()));
}
}  // namespace resolver
