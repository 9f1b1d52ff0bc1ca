#include "testing/testing.hpp"

#include "resolver/address_fields.hpp"
#include "resolver/address_matcher.hpp"
#include "resolver/address_scorer.hpp"
#include "resolver/candidate.hpp"

#include "coding/json.hpp"

#include "base/string_utils.hpp"

#include <string>
#include <vector>

using namespace resolver;
using namespace std;

namespace
{
double const kEps = 1e-9;

AddressNode MakeNode(string const & json)
{
  coding::JsonDocument document;
  coding::ParseJson(json, document);
  return MakeAddressNode(document);
}

StreetField MakeStreet(string const & name, boost::optional<string> const & from,
                       boost::optional<string> const & to)
{
  StreetField street;
  street.m_nameKey = kStreetName;
  street.m_name = name;
  street.m_buildingNoFrom = from;
  street.m_buildingNoTo = to;
  return street;
}

Candidate MakeCandidate(size_t rank, string const & chinese)
{
  Candidate candidate;
  candidate.m_rank = rank;
  candidate.m_chinese = MakeNode(chinese);
  return candidate;
}
}  // namespace

UNIT_TEST(MatchStr_Exact)
{
  auto const address = strings::MakeUniString("香港中環皇后大道中99號");
  auto const match = MatchStr(address, kStreetName, "皇后大道中");

  TEST_EQUAL(match.m_fieldName, kStreetName, ());
  TEST_EQUAL(match.m_fieldValue, "皇后大道中", ());
  TEST(match.m_span, ());
  TEST_EQUAL(match.m_span->first, 4u, ());
  TEST_EQUAL(match.m_span->second - match.m_span->first, 5u, ());
  TEST(match.m_goodness, ());
  TEST_NEAR(*match.m_goodness, 1.0, kEps, ());
}

UNIT_TEST(MatchStr_StripsHead)
{
  auto const match = MatchStr(strings::MakeUniString("兆康站"), "BuildingName", "港鐵兆康站");

  TEST(match.m_span, ());
  TEST_EQUAL(match.m_span->first, 0u, ());
  TEST_EQUAL(match.m_span->second, 3u, ());
  TEST(match.m_goodness, ());
  TEST_GREATER(*match.m_goodness, 0.0, ());
  TEST_LESS(*match.m_goodness, 1.0, ());
  TEST_NEAR(*match.m_goodness, 0.2, kEps, ());
}

UNIT_TEST(MatchStr_NoMatch)
{
  auto const match = MatchStr(strings::MakeUniString("彌敦道594號"), "BuildingName", "朗豪坊");
  TEST(!match.m_span, ());
  TEST(!match.m_goodness, ());
  TEST_EQUAL(match.m_fieldValue, "朗豪坊", ());
}

UNIT_TEST(MatchStr_GivesUpAfterHalf)
{
  // "FGH" would be found only after stripping more than a half of the value.
  auto const match = MatchStr(strings::MakeUniString("XFGH"), "BuildingName", "ABCDEFGH");
  TEST(!match.m_span, ());

  auto const half = MatchStr(strings::MakeUniString("XEFGH"), "BuildingName", "ABCDEFGH");
  TEST(half.m_span, ());
  TEST_NEAR(*half.m_goodness, 0.0, kEps, ());
}

UNIT_TEST(MatchChiStreet_RangeOverlaps)
{
  auto const address = strings::MakeUniString("彌敦道594號");
  auto const matches = MatchChiStreetOrVillage(address, MakeStreet("彌敦道", string("594"),
                                                                   string("596")));

  TEST_EQUAL(matches.size(), 3u, (matches));
  TEST_EQUAL(matches[0].m_fieldName, kStreetName, ());
  TEST(matches[0].m_span, ());

  TEST_EQUAL(matches[1].m_fieldName, kBuildingNoFrom, ());
  TEST_EQUAL(matches[1].m_fieldValue, "594", ());
  TEST(matches[1].m_span, ());
  TEST_EQUAL(matches[1].m_span->first, 3u, ());
  TEST_EQUAL(matches[1].m_span->second, 7u, ());
  TEST_NEAR(*matches[1].m_goodness, 1.0, kEps, ());

  TEST_EQUAL(matches[2].m_fieldName, kBuildingNoTo, ());
  TEST_EQUAL(matches[2].m_fieldValue, "596", ());
  TEST(matches[2].m_span, ());
  TEST_NEAR(*matches[2].m_goodness, 0.5, kEps, ());
}

UNIT_TEST(MatchChiStreet_RangeInAddress)
{
  auto const matches = MatchChiStreetOrVillage(strings::MakeUniString("彌敦道591-593號"),
                                               MakeStreet("彌敦道", string("591"), string("593")));
  TEST_EQUAL(matches.size(), 3u, (matches));
  TEST_NEAR(*matches[1].m_goodness, 1.0, kEps, ());
  TEST_NEAR(*matches[2].m_goodness, 1.0, kEps, ());
  TEST_EQUAL(matches[2].m_span->second, 11u, ());
}

UNIT_TEST(MatchChiStreet_RangeDoesNotOverlap)
{
  auto const matches = MatchChiStreetOrVillage(strings::MakeUniString("彌敦道600號"),
                                               MakeStreet("彌敦道", string("594"), string("596")));

  TEST_EQUAL(matches.size(), 3u, (matches));
  TEST(matches[0].m_span, ());
  TEST(!matches[1].m_span, ());
  TEST(!matches[2].m_span, ());
}

UNIT_TEST(MatchChiStreet_ComparesNumbersAsStrings)
{
  // "101" < "99" as strings, so 95-101 does not cover 99.
  auto const matches = MatchChiStreetOrVillage(strings::MakeUniString("皇后大道中99號"),
                                               MakeStreet("皇后大道中", string("95"), string("101")));
  TEST_EQUAL(matches.size(), 3u, (matches));
  TEST(!matches[1].m_span, ());
  TEST(!matches[2].m_span, ());
}

UNIT_TEST(MatchChiStreet_OnlyPresentSubfields)
{
  auto const address = strings::MakeUniString("屯門青麟路3號");

  auto const fromOnly = MatchChiStreetOrVillage(address, MakeStreet("屯門 青麟路", string("3"),
                                                                    boost::none));
  TEST_EQUAL(fromOnly.size(), 2u, (fromOnly));
  TEST_EQUAL(fromOnly[0].m_fieldValue, "青麟路", ());
  TEST_EQUAL(fromOnly[1].m_fieldName, kBuildingNoFrom, ());
  TEST(fromOnly[1].m_span, ());

  auto const nameOnly = MatchChiStreetOrVillage(address, MakeStreet("青麟路", boost::none,
                                                                    boost::none));
  TEST_EQUAL(nameOnly.size(), 1u, (nameOnly));

  auto const emptyFrom = MatchChiStreetOrVillage(address, MakeStreet("青麟路", string(""),
                                                                     string("5")));
  TEST_EQUAL(emptyFrom.size(), 1u, (emptyFrom));
}

UNIT_TEST(MatchChiStreet_NoBuildingNumberInAddress)
{
  auto const matches = MatchChiStreetOrVillage(strings::MakeUniString("屯門青麟路"),
                                               MakeStreet("青麟路", string("3"), boost::none));
  TEST_EQUAL(matches.size(), 2u, (matches));
  TEST(matches[0].m_span, ());
  TEST(!matches[1].m_span, ());
}

UNIT_TEST(MatchDict_Village)
{
  auto const node = MakeNode(R"({"ChiVillage": {"VillageName": "大埔頭村", "BuildingNoFrom": "12"},
                                 "ChiDistrict": {"DcDistrict": "大埔區"}})");
  auto const matches = MatchDict(strings::MakeUniString("大埔頭村12號"), node);

  TEST_EQUAL(matches.size(), 3u, (matches));
  TEST_EQUAL(matches[0].m_fieldName, kVillageName, ());
  TEST(matches[0].m_span, ());
  TEST_EQUAL(matches[1].m_fieldName, kBuildingNoFrom, ());
  TEST(matches[1].m_span, ());
  TEST_EQUAL(matches[2].m_fieldName, "DcDistrict", ());
  TEST(!matches[2].m_span, ());
}

UNIT_TEST(GetSimilarity_Weights)
{
  auto const chinese = MakeNode(R"({"Region": "九龍", "BuildingName": "朗豪坊",
                                    "ChiStreet": {"StreetName": "彌敦道", "BuildingNoFrom": "594",
                                                  "BuildingNoTo": "596"}})");
  auto const similarity = GetSimilarity("九龍彌敦道594號", chinese);

  // Region 10 + StreetName 20 + BuildingNoFrom 30 + BuildingNoTo 30 * 0.5 - 1 for BuildingName.
  TEST_NEAR(similarity.GetScore(), 74.0, kEps, (similarity));
  TEST_EQUAL(similarity.GetMatches().size(), 5u, ());

  vector<bool> const coverage(9, true);
  TEST_EQUAL(similarity.GetCoverage(), coverage, ());

  TEST_EQUAL(GetFieldWeight("BuildingName"), 40.0, ());
  TEST_EQUAL(GetFieldWeight("EstateName"), 20.0, ());
  TEST_EQUAL(GetFieldWeight("DcDistrict"), 0.0, ());
}

UNIT_TEST(GetSimilarity_DebugPrint)
{
  auto const similarity = GetSimilarity("兆康站A", MakeNode(R"({"BuildingName": "港鐵兆康站"})"));
  auto const s = DebugPrint(similarity);

  TEST_NEAR(similarity.GetScore(), 8.0, kEps, ());
  TEST(s.find("query: 兆康站A") != string::npos, (s));
  TEST(s.find("match: 兆康站?") != string::npos, (s));
  TEST(s.find("BuildingName") != string::npos, (s));
}

UNIT_TEST(ParseAddress_PicksBest)
{
  vector<Candidate> candidates = {
      MakeCandidate(0, R"({"BuildingName": "朗豪坊"})"),
      MakeCandidate(1, R"({"ChiStreet": {"StreetName": "彌敦道", "BuildingNoFrom": "594"}})"),
      MakeCandidate(2, R"({"Region": "九龍"})"),
  };

  auto const best = ParseAddress(candidates, "九龍彌敦道594號");
  TEST(best, ());
  TEST_EQUAL(best->m_rank, 1u, ());
  TEST(best->m_similarity, ());
  TEST_NEAR(best->m_similarity->GetScore(), 50.0, kEps, ());

  TEST_EQUAL(candidates[0].m_rank, 1u, ());
  TEST_EQUAL(candidates[1].m_rank, 2u, ());
  TEST_EQUAL(candidates[2].m_rank, 0u, ());
}

UNIT_TEST(ParseAddress_TieKeepsServiceOrder)
{
  vector<Candidate> candidates = {
      MakeCandidate(0, R"({"Region": "新界"})"),
      MakeCandidate(1, R"({"ChiStreet": {"StreetName": "青麟路"}})"),
      MakeCandidate(2, R"({"ChiStreet": {"StreetName": "青麟路"}})"),
  };

  auto const best = ParseAddress(candidates, "屯門青麟路");
  TEST(best, ());
  TEST_EQUAL(best->m_rank, 1u, ());
}

UNIT_TEST(ParseAddress_Empty)
{
  vector<Candidate> candidates;
  TEST(!ParseAddress(candidates, "屯門青麟路"), ());
}
