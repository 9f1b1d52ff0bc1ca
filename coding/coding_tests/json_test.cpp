#include "testing/testing.hpp"

#include "coding/json.hpp"

#include <string>

using namespace coding;
using namespace std;

UNIT_TEST(Json_ObligatoryFieldByPath)
{
  JsonDocument doc;
  ParseJson(R"({"Address": {"PremisesAddress": {"ChiPremisesAddress": {"Region": "港"}}}})", doc);

  auto const & chi =
      GetJsonObligatoryFieldByPath(doc, "Address", "PremisesAddress", "ChiPremisesAddress");
  auto const & region = GetJsonObligatoryField(chi, "Region");
  TEST(region.IsString(), ());
  TEST_EQUAL(string(region.GetString()), "港", ());

  TEST_THROW(GetJsonObligatoryFieldByPath(doc, "Address", "Missing"), JsonException, ());
  TEST_THROW(GetJsonObligatoryFieldByPath(doc, "Address", "PremisesAddress", "ChiPremisesAddress",
                                          "Region", "Deeper"),
             JsonException, ());
}

UNIT_TEST(Json_OptionalField)
{
  JsonDocument doc;
  ParseJson(R"({"Score": 85.5, "Name": "x"})", doc);

  TEST_ALMOST_EQUAL_ULPS(GetJsonOptionalField(doc, "Score").GetDouble(), 85.5, ());
  TEST(GetJsonOptionalField(doc, "Missing").IsNull(), ());
  TEST_THROW(GetJsonOptionalField(doc["Score"], "Name"), JsonException, ());
}

UNIT_TEST(Json_ParseErrors)
{
  JsonDocument doc;
  TEST_THROW(ParseJson("{\"SuggestedAddress\": [", doc), JsonException, ());
  TEST_THROW(ParseJson("", doc), JsonException, ());
}

UNIT_TEST(Json_ToString)
{
  JsonDocument doc;
  ParseJson(R"({ "Latitude" : "22.28", "Longitude": 114.15 })", doc);
  TEST_EQUAL(ToJsonString(doc), R"({"Latitude":"22.28","Longitude":114.15})", ());
}
