#pragma once

#include "resolver/lookup_service.hpp"
#include "resolver/rate_limiter.hpp"

#include "coding/json.hpp"

#include "base/macros.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace resolver
{
// The parsed service response holding a non-empty "SuggestedAddress" array.
using RawResponse = std::unique_ptr<coding::JsonDocument>;

struct FetcherParams
{
  // Maximal number of requests being in flight at the same time.
  size_t m_maxInFlight = 20;
  // Maximal number of attempts per query.
  size_t m_maxRetries = 10;
  double m_sleepMultiplier = 2.0;
  // Backoff sleeps are measured in these units.
  std::chrono::milliseconds m_backoffUnit{1000};
};

// Resolves queries to service responses. Every attempt is admitted by a
// slot of the in-flight cap and a token of the rate limiter, both are
// released before the backoff sleep.
//
// Thread-safety: YES, Fetch() is meant to be called from many threads.
class Fetcher
{
public:
  struct Stats
  {
    // Number of requests sent to the lookup service.
    uint64_t m_attempts = 0;

    // Number of failed attempts (transport, http status or malformed body).
    uint64_t m_transientFailures = 0;

    // Number of queries which failed all |m_maxRetries| attempts.
    uint64_t m_exhausted = 0;

    // Number of well-formed responses without suggestions.
    uint64_t m_emptyResponses = 0;
  };

  Fetcher(LookupService & service, RateLimiter & rateLimiter, FetcherParams const & params);

  // Returns the response for |query| or nullptr if the service has no
  // suggestions or all the attempts failed. |address| is the original
  // (not normalized) address, it is used for diagnostics only.
  RawResponse Fetch(std::string const & query, std::string const & address);

  Stats GetStats() const;
  FetcherParams const & GetParams() const { return m_params; }

  // Backoff before the next attempt after |failures| failed attempts in a row.
  std::chrono::milliseconds GetBackoff(size_t failures) const;

  // Maximal number of simultaneous attempts observed so far.
  size_t GetMaxObservedInFlight() const { return m_gate.GetMaxObserved(); }

private:
  // Counting gate for the in-flight cap.
  class InFlightGate
  {
  public:
    explicit InFlightGate(size_t capacity);

    void Enter();
    void Leave();

    size_t GetMaxObserved() const;

  private:
    size_t const m_capacity;
    size_t m_inFlight = 0;
    size_t m_maxObserved = 0;
    mutable std::mutex m_mutex;
    std::condition_variable m_left;
  };

  // Returns nullptr when the body is well-formed but has no suggestions,
  // throws on malformed bodies.
  static RawResponse ParseResponse(std::string const & body);

  LookupService & m_service;
  RateLimiter & m_rateLimiter;
  FetcherParams const m_params;
  InFlightGate m_gate;

  std::atomic<uint64_t> m_attempts{0};
  std::atomic<uint64_t> m_transientFailures{0};
  std::atomic<uint64_t> m_exhausted{0};
  std::atomic<uint64_t> m_emptyResponses{0};

  DISALLOW_COPY_AND_MOVE(Fetcher);
};
}  // namespace resolver
