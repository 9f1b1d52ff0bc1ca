#include "testing/testing.hpp"

#include "resolver/address_normalizer.hpp"

#include <string>

using resolver::RemoveFloor;

UNIT_TEST(RemoveFloor_Floors)
{
  TEST_EQUAL(RemoveFloor("彌敦道594號3樓A室"), "彌敦道594號", ());
  TEST_EQUAL(RemoveFloor("屯門青麟路3號 12 樓"), "屯門青麟路3號", ());
  TEST_EQUAL(RemoveFloor("屯門青麟路3號　12層"), "屯門青麟路3號", ());
  TEST_EQUAL(RemoveFloor("觀塘道388號 G-1樓"), "觀塘道388號", ());
  TEST_EQUAL(RemoveFloor("屯門青麟路3號\u00a012樓"), "屯門青麟路3號", ());
  TEST_EQUAL(RemoveFloor("屯門青麟路3號\u2009G\u202f樓"), "屯門青麟路3號", ());
}

UNIT_TEST(RemoveFloor_ShopsBasementsPodiums)
{
  TEST_EQUAL(RemoveFloor("天水圍嘉湖銀座A23舖"), "天水圍嘉湖銀座", ());
  TEST_EQUAL(RemoveFloor("旺角彌敦道594號地下"), "旺角彌敦道594號", ());
  TEST_EQUAL(RemoveFloor("九龍灣宏開道8號地庫B2"), "九龍灣宏開道8號", ());
  TEST_EQUAL(RemoveFloor("沙田正街18號平台"), "沙田正街18號", ());
}

UNIT_TEST(RemoveFloor_NothingToRemove)
{
  TEST_EQUAL(RemoveFloor("香港中環皇后大道中99號"), "香港中環皇后大道中99號", ());
  TEST_EQUAL(RemoveFloor(""), "", ());
}

UNIT_TEST(RemoveFloor_CutsLineOnly)
{
  TEST_EQUAL(RemoveFloor("彌敦道594號3樓A室\n觀塘道388號"), "彌敦道594號\n觀塘道388號", ());
  TEST_EQUAL(RemoveFloor("彌敦道594號3樓\n觀塘道388號地下"), "彌敦道594號\n觀塘道388號", ());
}

UNIT_TEST(RemoveFloor_LongTail)
{
  std::string const tail(100000, 'x');
  TEST_EQUAL(RemoveFloor("道1號3樓" + tail), "道1號", ());
}
