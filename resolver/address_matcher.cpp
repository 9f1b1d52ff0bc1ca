#include "resolver/address_matcher.hpp"

#include "base/assert.hpp"

#include <algorithm>
#include <iterator>
#include <regex>
#include <sstream>
#include <unordered_map>

using namespace std;
using strings::UniString;

namespace resolver
{
namespace
{
// Building numbers right after the street name: "594號", "591-593號", "1至3號", "12A號".
wregex const & BuildingNoRegex()
{
  static wregex const kRegex(L"([0-9A-z]+)[至及\\-]*([0-9A-z]*)號");
  return kRegex;
}

UniString ToUniString(wstring const & s) { return UniString(s.begin(), s.end()); }

class FieldMatcher : public boost::static_visitor<void>
{
public:
  FieldMatcher(UniString const & address, string const & key, FieldMatches & matches)
    : m_address(address), m_key(key), m_matches(matches)
  {
  }

  void operator()(string const & value) const
  {
    m_matches.push_back(MatchStr(m_address, m_key, value));
  }

  void operator()(StreetField const & street) const
  {
    Append(MatchChiStreetOrVillage(m_address, street));
  }

  void operator()(AddressNode const & node) const { Append(MatchDict(m_address, node)); }

private:
  void Append(FieldMatches && matches) const
  {
    move(matches.begin(), matches.end(), back_inserter(m_matches));
  }

  UniString const & m_address;
  string const & m_key;
  FieldMatches & m_matches;
};
}  // namespace

// Similarity --------------------------------------------------------------------------------------
Similarity::Similarity(string const & query, double score, vector<bool> && coverage,
                       FieldMatches && matches)
  : m_query(query), m_score(score), m_coverage(move(coverage)), m_matches(move(matches))
{
}

// Matching ----------------------------------------------------------------------------------------
FieldMatch MatchStr(UniString const & address, string const & fieldName, string const & value)
{
  auto const uniValue = strings::MakeUniString(value);
  size_t const length = uniValue.size();

  for (size_t stripped = 0; stripped < length; ++stripped)
  {
    auto const rest = uniValue.substr(stripped);
    auto const pos = address.find(rest);
    if (pos != UniString::npos)
    {
      double const goodness = (static_cast<double>(rest.size()) / length - 0.5) * 2;
      return FieldMatch(fieldName, value, Span(pos, pos + rest.size()), goodness);
    }

    if (length - stripped <= 3 || stripped >= length / 2)
      break;
  }

  return FieldMatch(fieldName, value, boost::none, boost::none);
}

FieldMatches MatchChiStreetOrVillage(UniString const & address, StreetField const & street)
{
  FieldMatches matches;

  // The service may prefix the name with its area, e.g. "屯門 青麟路".
  auto const tokens = strings::TokenizeBySpaces(strings::MakeUniString(street.m_name));
  string const name = tokens.empty() ? string() : strings::ToUtf8(tokens.back());
  matches.push_back(MatchStr(address, street.m_nameKey, name));
  auto const streetSpan = matches.back().m_span;

  string const ogcioFrom = street.m_buildingNoFrom.value_or(string());
  if (ogcioFrom.empty())
    return matches;

  boost::optional<Span> span;
  UniString addressFrom;
  UniString addressTo;

  if (streetSpan)
  {
    size_t const end = streetSpan->second;
    wstring const rest(address.begin() + end, address.end());
    wsmatch match;
    if (regex_search(rest, match, BuildingNoRegex(), regex_constants::match_continuous))
    {
      auto const begin = end + static_cast<size_t>(match.position(0));
      span = Span(begin, begin + static_cast<size_t>(match.length(0)));
      addressFrom = ToUniString(match[1].str());
      addressTo = ToUniString(match[2].str());
    }
  }

  UniString const uniFrom = strings::MakeUniString(ogcioFrom);
  UniString uniTo = strings::MakeUniString(street.m_buildingNoTo.value_or(string()));
  if (uniTo.empty())
    uniTo = uniFrom;
  if (addressTo.empty())
    addressTo = addressFrom;

  // Building numbers are compared as strings, so "101" < "99".
  if (uniTo < addressFrom || uniFrom > addressTo)
    span = boost::none;

  if (street.m_buildingNoFrom)
  {
    double const goodness = addressFrom == uniFrom ? 1.0 : 0.5;
    matches.emplace_back(kBuildingNoFrom, ogcioFrom, span, goodness);
  }
  if (street.m_buildingNoTo)
  {
    double const goodness = addressTo == uniTo ? 1.0 : 0.5;
    matches.emplace_back(kBuildingNoTo, strings::ToUtf8(uniTo), span, goodness);
  }

  return matches;
}

FieldMatches MatchDict(UniString const & address, AddressNode const & node)
{
  FieldMatches matches;
  for (auto const & field : node.GetFields())
    boost::apply_visitor(FieldMatcher(address, field.first, matches), field.second);
  return matches;
}

double GetFieldWeight(string const & fieldName)
{
  static unordered_map<string, double> const kWeights = {
      {"Region", 10},         {kStreetName, 20},   {kVillageName, 20}, {"EstateName", 20},
      {kBuildingNoFrom, 30},  {kBuildingNoTo, 30}, {"BuildingName", 40},
  };

  auto const it = kWeights.find(fieldName);
  return it == kWeights.end() ? 0.0 : it->second;
}

Similarity GetSimilarity(string const & address, AddressNode const & chinese)
{
  auto const uniAddress = strings::MakeUniString(address);
  auto matches = MatchDict(uniAddress, chinese);

  vector<bool> coverage(uniAddress.size(), false);
  double score = 0;
  for (auto const & match : matches)
  {
    if (!match.m_span)
    {
      score -= 1;
      continue;
    }

    CHECK(match.m_goodness, (match));
    score += GetFieldWeight(match.m_fieldName) * *match.m_goodness;

    CHECK_LESS_OR_EQUAL(match.m_span->second, coverage.size(), (match));
    for (size_t i = match.m_span->first; i < match.m_span->second; ++i)
      coverage[i] = true;
  }

  return Similarity(address, score, move(coverage), move(matches));
}

string DebugPrint(FieldMatch const & match)
{
  ostringstream out;
  out << "(" << match.m_fieldName << ", " << match.m_fieldValue << ", ";
  if (match.m_span)
    out << "[" << match.m_span->first << ", " << match.m_span->second << ")";
  else
    out << "None";
  out << ", ";
  if (match.m_goodness)
    out << *match.m_goodness;
  else
    out << "None";
  out << ")";
  return out.str();
}

string DebugPrint(Similarity const & similarity)
{
  auto const query = strings::MakeUniString(similarity.GetQuery());
  auto const & coverage = similarity.GetCoverage();

  UniString covered;
  for (size_t i = 0; i < query.size(); ++i)
    covered.push_back(i < coverage.size() && coverage[i] ? query[i] : U'?');

  ostringstream out;
  out << "query: " << similarity.GetQuery() << "\n";
  out << "match: " << strings::ToUtf8(covered) << "\n";
  out << "matches: " << ::DebugPrint(similarity.GetMatches()) << "\n";
  out << "score: " << similarity.GetScore() << "\n";
  return out.str();
}
}  // namespace resolver
