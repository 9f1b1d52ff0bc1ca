#include "base/src_point.hpp"

#include <cstring>
#include <sstream>

namespace base
{
void SrcPoint::TruncateFileName()
{
  size_t const kMaxSlashes = 2;

  size_t slashes = 0;
  char const * p = m_fileName + std::strlen(m_fileName);
  while (p != m_fileName)
  {
    --p;
    if (*p == '/' && ++slashes == kMaxSlashes)
    {
      ++p;
      break;
    }
  }
  m_fileName = p;
}

std::string DebugPrint(SrcPoint const & srcPoint)
{
  std::ostringstream out;
  if (srcPoint.Line() > 0)
    out << srcPoint.FileName() << ":" << srcPoint.Line() << " " << srcPoint.Function() << "() ";
  return out.str();
}
}  // namespace base
