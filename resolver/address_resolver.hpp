#pragma once

#include "resolver/fetcher.hpp"
#include "resolver/lookup_service.hpp"
#include "resolver/output_record.hpp"
#include "resolver/rate_limiter.hpp"

#include "base/macros.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace resolver
{
struct ResolverParams
{
  // Requests per second.
  double m_rateLimit = 20.0;
  FetcherParams m_fetcher;
  // Number of worker threads, 0 means FetcherParams::m_maxInFlight.
  size_t m_threads = 0;
  // Longer addresses, in code points, are dropped without a lookup.
  size_t m_maxAddressLength = 1024;
};

// Resolves a batch of free-form addresses to structured ones: every address
// is normalized, looked up, and the best suggestion is projected to an
// OutputRecord.
class AddressResolver
{
public:
  // Throws RateLimiter::ConfigException on a bad rate limit.
  AddressResolver(LookupService & service, ResolverParams const & params);

  // Returns records of the resolved addresses in the order of |addresses|.
  // Addresses which are not resolved are dropped and logged.
  std::vector<OutputRecord> Resolve(std::vector<std::string> const & addresses);

  // Resolves a single address, returns boost::none if it is not resolved.
  boost::optional<OutputRecord> ResolveOne(std::string const & address);

  Fetcher const & GetFetcher() const { return m_fetcher; }

private:
  ResolverParams const m_params;
  RateLimiter m_rateLimiter;
  Fetcher m_fetcher;

  DISALLOW_COPY_AND_MOVE(AddressResolver);
};
}  // namespace resolver
