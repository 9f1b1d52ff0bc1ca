#pragma once

#include "base/exception.hpp"

#include <string>

namespace resolver
{
// The address lookup capability: answers a free-text query with the raw body
// of the service response.
class LookupService
{
public:
  DECLARE_EXCEPTION(LookupException, RootException);

  virtual ~LookupService() = default;

  // Returns the response body. Throws LookupException on transport errors and
  // non-success statuses.
  // Thread-safety: implementations must allow concurrent calls.
  virtual std::string Lookup(std::string const & query) = 0;
};
}  // namespace resolver
