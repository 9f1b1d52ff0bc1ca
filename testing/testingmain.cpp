#include "testing/testing.hpp"

#include "base/logging.hpp"

int main(int argc, char * argv[])
{
  // Tests print bare messages, without levels and source points.
  base::SetLogMessageFn(&base::LogMessageTests);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
