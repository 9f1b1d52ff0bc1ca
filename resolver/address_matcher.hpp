#pragma once

#include "resolver/address_fields.hpp"

#include "base/string_utils.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

namespace resolver
{
// Half-open range [first, second) of code points of the query.
using Span = std::pair<size_t, size_t>;

// The result of looking for one field of a candidate in the query.
struct FieldMatch
{
  FieldMatch(std::string const & fieldName, std::string const & fieldValue,
             boost::optional<Span> const & span, boost::optional<double> const & goodness)
    : m_fieldName(fieldName), m_fieldValue(fieldValue), m_span(span), m_goodness(goodness)
  {
  }

  std::string m_fieldName;
  std::string m_fieldValue;
  // boost::none when the field is not found in the query.
  boost::optional<Span> m_span;
  // In [-1, 1], 1 means that the whole value is found.
  boost::optional<double> m_goodness;
};

using FieldMatches = std::vector<FieldMatch>;

// Aggregated matching of one candidate against one query.
class Similarity
{
public:
  Similarity(std::string const & query, double score, std::vector<bool> && coverage,
             FieldMatches && matches);

  std::string const & GetQuery() const { return m_query; }
  double GetScore() const { return m_score; }
  // One flag per code point of the query: whether some field match covers it.
  std::vector<bool> const & GetCoverage() const { return m_coverage; }
  FieldMatches const & GetMatches() const { return m_matches; }

private:
  std::string m_query;
  double m_score = 0.0;
  std::vector<bool> m_coverage;
  FieldMatches m_matches;
};

// Looks for |value| in |address|. When |value| is not found as a whole its
// head is stripped char by char to deal with cases like "港鐵兆康站" in the
// candidate and "兆康站" in the query. Gives up when the rest is 3 chars or
// shorter or when a half of |value| is already stripped.
FieldMatch MatchStr(strings::UniString const & address, std::string const & fieldName,
                    std::string const & value);

// Matches the name of |street| and the building number range which follows
// the name in |address|, e.g. "彌敦道594-596號".
FieldMatches MatchChiStreetOrVillage(strings::UniString const & address,
                                     StreetField const & street);

FieldMatches MatchDict(strings::UniString const & address, AddressNode const & node);

// Weight of a matched field in the similarity score, 0 for unknown fields.
double GetFieldWeight(std::string const & fieldName);

// Scores |address| against the Chinese structured address of a candidate:
// every unmatched field costs 1, every matched one gives
// GetFieldWeight() * goodness.
Similarity GetSimilarity(std::string const & address, AddressNode const & chinese);

std::string DebugPrint(FieldMatch const & match);
std::string DebugPrint(Similarity const & similarity);
}  // namespace resolver
