#include "testing/testing.hpp"

#include "resolver/address_resolver.hpp"
#include "resolver/rate_limiter.hpp"
#include "resolver/resolver_tests/stub_lookup_service.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace resolver;
using namespace resolver::tests_support;
using namespace std;

namespace
{
string const kQueensRoad = R"({"Region": "港島", "ChiDistrict": {"DcDistrict": "中西區"},
                               "ChiStreet": {"StreetName": "皇后大道中", "BuildingNoFrom": "95",
                                             "BuildingNoTo": "101"}})";
string const kQueensRoadEng = R"({"Region": "HK", "EngDistrict": {"DcDistrict": "CENTRAL & WESTERN DISTRICT"},
                                  "EngStreet": {"StreetName": "QUEEN'S ROAD CENTRAL",
                                                "BuildingNoFrom": "95", "BuildingNoTo": "101"}})";

ResolverParams MakeParams()
{
  ResolverParams params;
  params.m_rateLimit = 1000.0;
  params.m_threads = 4;
  params.m_fetcher.m_maxRetries = 3;
  params.m_fetcher.m_backoffUnit = chrono::milliseconds(1);
  return params;
}
}  // namespace

UNIT_TEST(AddressResolver_EndToEnd)
{
  base::ScopedLogLevelChanger logLevel(LCRITICAL);
  StubLookupService service([](string const &, size_t) {
    return MakeResponse(kQueensRoad, kQueensRoadEng, "87.5");
  });
  AddressResolver resolver(service, MakeParams());

  auto const records = resolver.Resolve({"香港中環皇后大道中99號"});
  TEST_EQUAL(records.size(), 1u, ());

  auto const & record = records[0];
  TEST_EQUAL(record.m_inputAddress, "香港中環皇后大道中99號", ());
  TEST_EQUAL(record.m_chiStreetName, "皇后大道中", ());
  TEST_EQUAL(record.m_chiBuildingNo, "95", ());
  TEST_EQUAL(record.m_chiDistrict, "中西區", ());
  TEST_EQUAL(record.m_engStreetName, "QUEEN'S ROAD CENTRAL", ());
  TEST_EQUAL(record.m_score, 87, ());
  // StreetName 20, unmatched Region, DcDistrict, and the building numbers
  // ("101" < "99" as strings) cost 1 each.
  TEST_NEAR(record.m_matchScore, 16.0, 1e-9, ());
}

UNIT_TEST(AddressResolver_QueriesNormalizedAddress)
{
  base::ScopedLogLevelChanger logLevel(LCRITICAL);
  StubLookupService service([](string const &, size_t) {
    return MakeResponse(kQueensRoad, kQueensRoadEng);
  });
  AddressResolver resolver(service, MakeParams());

  auto const records = resolver.Resolve({"皇后大道中99號12樓"});
  TEST_EQUAL(records.size(), 1u, ());
  TEST_EQUAL(records[0].m_inputAddress, "皇后大道中99號12樓", ());
  TEST_EQUAL(service.GetCalls("皇后大道中99號"), 1u, ());
  TEST_EQUAL(service.GetCalls("皇后大道中99號12樓"), 0u, ());
}

UNIT_TEST(AddressResolver_DropsUnresolvedKeepsOrder)
{
  base::ScopedLogLevelChanger logLevel(LCRITICAL);

  vector<string> addresses;
  for (size_t i = 0; i < 10; ++i)
    addresses.push_back("皇后大道中" + to_string(i) + "號");

  // Addresses 2 and 7 have no suggestions, 5 always fails, 8 gets a malformed suggestion.
  StubLookupService service([](string const & query, size_t) -> string {
    if (query == "皇后大道中2號" || query == "皇后大道中7號")
      return GetEmptyResponse();
    if (query == "皇后大道中5號")
      MYTHROW(LookupService::LookupException, ("HTTP 503"));
    if (query == "皇后大道中8號")
      return R"({"SuggestedAddress": [{"Address": {}}]})";
    return MakeResponse(kQueensRoad, kQueensRoadEng);
  });
  AddressResolver resolver(service, MakeParams());

  auto const records = resolver.Resolve(addresses);

  vector<string> resolved;
  for (auto const & record : records)
    resolved.push_back(record.m_inputAddress);

  vector<string> const expected = {"皇后大道中0號", "皇后大道中1號", "皇后大道中3號",
                                   "皇后大道中4號", "皇后大道中6號", "皇后大道中9號"};
  TEST_EQUAL(resolved, expected, ());

  auto const stats = resolver.GetFetcher().GetStats();
  TEST_EQUAL(stats.m_exhausted, 1u, ());
  TEST_EQUAL(stats.m_emptyResponses, 2u, ());
  TEST_EQUAL(service.GetCalls("皇后大道中5號"), 3u, ());
}

UNIT_TEST(AddressResolver_BadRateLimit)
{
  StubLookupService service([](string const &, size_t) { return GetEmptyResponse(); });
  auto params = MakeParams();
  params.m_rateLimit = 0;
  TEST_THROW(AddressResolver(service, params), RateLimiter::ConfigException, ());
  TEST_EQUAL(service.GetTotalCalls(), 0u, ());
}

UNIT_TEST(AddressResolver_DropsTooLongAddress)
{
  base::ScopedLogLevelChanger logLevel(LCRITICAL);
  StubLookupService service([](string const &, size_t) {
    return MakeResponse(kQueensRoad, kQueensRoadEng);
  });
  AddressResolver resolver(service, MakeParams());

  string const tooLong = "皇后大道中99號" + string(100000, '9');
  auto const records = resolver.Resolve({tooLong, "皇后大道中99號"});
  TEST_EQUAL(records.size(), 1u, ());
  TEST_EQUAL(records[0].m_inputAddress, "皇后大道中99號", ());
  TEST_EQUAL(service.GetTotalCalls(), 1u, ());
}
