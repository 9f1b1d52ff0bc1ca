#include "base/exception.hpp"

RootException::RootException(char const * what, std::string const & msg) : m_msg(msg)
{
  m_whatWithMsg = std::string(what);
  if (!m_msg.empty())
    m_whatWithMsg += ", \"" + m_msg + "\"";
}
