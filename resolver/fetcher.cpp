#include "resolver/fetcher.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace resolver
{
namespace
{
char const kSuggestedAddress[] = "SuggestedAddress";

template <typename Gate>
class ScopedEnter
{
public:
  explicit ScopedEnter(Gate & gate) : m_gate(gate) { m_gate.Enter(); }
  ~ScopedEnter() { m_gate.Leave(); }

private:
  Gate & m_gate;
};
}  // namespace

// Fetcher::InFlightGate ---------------------------------------------------------------------------
Fetcher::InFlightGate::InFlightGate(size_t capacity) : m_capacity(capacity)
{
  CHECK_GREATER(m_capacity, 0, ());
}

void Fetcher::InFlightGate::Enter()
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_left.wait(lock, [this] { return m_inFlight < m_capacity; });
  ++m_inFlight;
  m_maxObserved = std::max(m_maxObserved, m_inFlight);
}

void Fetcher::InFlightGate::Leave()
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    CHECK_GREATER(m_inFlight, 0, ());
    --m_inFlight;
  }
  m_left.notify_one();
}

size_t Fetcher::InFlightGate::GetMaxObserved() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_maxObserved;
}

// Fetcher -----------------------------------------------------------------------------------------
Fetcher::Fetcher(LookupService & service, RateLimiter & rateLimiter, FetcherParams const & params)
  : m_service(service), m_rateLimiter(rateLimiter), m_params(params), m_gate(params.m_maxInFlight)
{
}

RawResponse Fetcher::Fetch(std::string const & query, std::string const & address)
{
  for (size_t attempt = 1; attempt <= m_params.m_maxRetries; ++attempt)
  {
    try
    {
      std::string body;
      {
        ScopedEnter<InFlightGate> inFlight(m_gate);
        m_rateLimiter.Acquire();
        ++m_attempts;
        body = m_service.Lookup(query);
      }

      auto response = ParseResponse(body);
      if (!response)
      {
        ++m_emptyResponses;
        LOG(LDEBUG, ("No suggestions for", address));
      }
      return response;
    }
    catch (RateLimiter::ClosedException const &)
    {
      LOG(LERROR, ("fetch: rate limiter is closed, giving up on", address, "at attempt", attempt));
      return nullptr;
    }
    catch (RootException const & e)
    {
      ++m_transientFailures;
      LOG(LWARNING, ("fetch: attempt", attempt, "of", m_params.m_maxRetries, "failed for", address,
                     "query:", query, "cause:", e.what()));
    }

    if (attempt < m_params.m_maxRetries)
      std::this_thread::sleep_for(GetBackoff(attempt));
  }

  ++m_exhausted;
  LOG(LERROR, ("fetch: max retries exceeded for", address, "after", m_params.m_maxRetries,
               "attempts"));
  return nullptr;
}

Fetcher::Stats Fetcher::GetStats() const
{
  Stats stats;
  stats.m_attempts = m_attempts;
  stats.m_transientFailures = m_transientFailures;
  stats.m_exhausted = m_exhausted;
  stats.m_emptyResponses = m_emptyResponses;
  return stats;
}

std::chrono::milliseconds Fetcher::GetBackoff(size_t failures) const
{
  CHECK_GREATER(failures, 0, ());
  double const units = failures == 1 ? 1.0 : m_params.m_sleepMultiplier * (failures - 1);
  return std::chrono::duration_cast<std::chrono::milliseconds>(units * m_params.m_backoffUnit);
}

// static
RawResponse Fetcher::ParseResponse(std::string const & body)
{
  auto document = std::make_unique<coding::JsonDocument>();
  coding::ParseJson(body, *document);

  if (!document->IsObject())
    return nullptr;

  auto const & suggestions = coding::GetJsonOptionalField(*document, kSuggestedAddress);
  if (!suggestions.IsArray() || suggestions.Empty())
    return nullptr;

  return document;
}
}  // namespace resolver
