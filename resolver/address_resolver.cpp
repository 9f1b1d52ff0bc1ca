#include "resolver/address_resolver.hpp"

#include "resolver/address_normalizer.hpp"
#include "resolver/address_scorer.hpp"
#include "resolver/candidate.hpp"

#include "base/logging.hpp"
#include "base/string_utils.hpp"
#include "base/thread_pool_computational.hpp"

#include <exception>
#include <future>
#include <utility>

namespace resolver
{
AddressResolver::AddressResolver(LookupService & service, ResolverParams const & params)
  : m_params(params)
  , m_rateLimiter(params.m_rateLimit)
  , m_fetcher(service, m_rateLimiter, params.m_fetcher)
{
}

std::vector<OutputRecord> AddressResolver::Resolve(std::vector<std::string> const & addresses)
{
  size_t const threads =
      m_params.m_threads != 0 ? m_params.m_threads : m_params.m_fetcher.m_maxInFlight;
  LOG(LINFO, ("Resolving", addresses.size(), "addresses with", threads, "threads"));

  std::vector<std::future<boost::optional<OutputRecord>>> results;
  results.reserve(addresses.size());
  {
    base::thread_pool::computational::ThreadPool pool(threads);
    for (auto const & address : addresses)
      results.emplace_back(pool.Submit([this, &address] { return ResolveOne(address); }));
  }

  std::vector<OutputRecord> records;
  records.reserve(results.size());
  for (auto & result : results)
  {
    auto record = result.get();
    if (record)
      records.push_back(std::move(*record));
  }

  auto const stats = m_fetcher.GetStats();
  LOG(LINFO, ("Resolved", records.size(), "of", addresses.size(), "addresses. Requests:",
              stats.m_attempts, "failed:", stats.m_transientFailures,
              "exhausted:", stats.m_exhausted, "without suggestions:", stats.m_emptyResponses));
  return records;
}

boost::optional<OutputRecord> AddressResolver::ResolveOne(std::string const & address)
{
  char const * stage = "normalize";
  try
  {
    auto const uni = strings::MakeUniString(address);
    if (uni.size() > m_params.m_maxAddressLength)
    {
      LOG(LWARNING, ("Address of", uni.size(), "characters is too long, dropped:",
                     strings::ToUtf8(uni.substr(0, 32))));
      return {};
    }

    auto const query = RemoveFloor(address);

    stage = "fetch";
    auto const response = m_fetcher.Fetch(query, address);
    if (!response)
      return {};

    stage = "flatten";
    auto candidates =
        FlattenCandidates(coding::GetJsonObligatoryField(*response, "SuggestedAddress"));

    stage = "score";
    auto const best = ParseAddress(candidates, address);
    if (!best)
      return {};

    stage = "extract";
    auto record = MakeOutputRecord(*best, address);
    LOG(LDEBUG, (record));
    return record;
  }
  catch (RootException const & e)
  {
    LOG(LERROR, ("Failed to", stage, address, ":", e.Msg()));
  }
  catch (std::exception const & e)
  {
    LOG(LERROR, ("Failed to", stage, address, ":", e.what()));
  }
  return {};
}
}  // namespace resolver
