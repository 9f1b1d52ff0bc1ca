#include "base/assert.hpp"

#include <iostream>
#include <utility>

namespace base
{
namespace
{
bool OnAssertFailedDefault(SrcPoint const & srcPoint, std::string const & msg)
{
  std::cerr << "ASSERT FAILED" << std::endl
            << DebugPrint(srcPoint) << msg << std::endl;
  return true;
}
}  // namespace

AssertFailedFn OnAssertFailed = &OnAssertFailedDefault;

AssertFailedFn SetAssertFunction(AssertFailedFn fn)
{
  std::swap(fn, OnAssertFailed);
  return fn;
}
}  // namespace base
