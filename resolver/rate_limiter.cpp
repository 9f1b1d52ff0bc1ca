#include "resolver/rate_limiter.hpp"

#include "base/logging.hpp"

#include <algorithm>
#include <cmath>

namespace resolver
{
namespace
{
double CheckedRate(double rateLimit)
{
  if (!std::isfinite(rateLimit) || rateLimit <= 0)
    MYTHROW(RateLimiter::ConfigException, ("Rate limit must be positive, got", rateLimit));
  return rateLimit;
}

RateLimiter::Clock::duration RefillPeriodFor(double rateLimit)
{
  auto const period = std::chrono::duration_cast<RateLimiter::Clock::duration>(
      std::chrono::duration<double>(1.0 / rateLimit));
  return std::max(period, RateLimiter::kMinSleep);
}
}  // namespace

// static
RateLimiter::Clock::duration const RateLimiter::kMinSleep = std::chrono::milliseconds(100);

// static
size_t RateLimiter::CapacityFor(double rateLimit)
{
  return static_cast<size_t>(std::min(2.0, std::floor(rateLimit) + 1));
}

RateLimiter::RateLimiter(double rateLimit)
  : m_rateLimit(CheckedRate(rateLimit))
  , m_capacity(CapacityFor(m_rateLimit))
  , m_refillPeriod(RefillPeriodFor(m_rateLimit))
  , m_tokens(m_capacity)
{
  m_filler = std::thread(&RateLimiter::Fill, this);
}

RateLimiter::~RateLimiter()
{
  Close();
}

void RateLimiter::Acquire()
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_tokenAdded.wait(lock, [this] { return m_closed || m_tokens > 0; });
  if (m_closed)
    MYTHROW(ClosedException, ("Rate limiter is closed"));
  --m_tokens;
}

void RateLimiter::Close()
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed && !m_filler.joinable())
      return;
    m_closed = true;
  }
  m_closing.notify_all();
  m_tokenAdded.notify_all();

  if (m_filler.joinable() && m_filler.get_id() != std::this_thread::get_id())
    m_filler.join();
}

void RateLimiter::Fill()
{
  auto updatedAt = Clock::now();
  // Fractional tokens carried over between refills, so that short refill
  // periods do not lose tokens to truncation.
  double fraction = 0;

  std::unique_lock<std::mutex> lock(m_mutex);
  while (!m_closed)
  {
    if (m_tokens < m_capacity)
    {
      auto const now = Clock::now();
      double const increment =
          m_rateLimit * std::chrono::duration<double>(now - updatedAt).count();
      fraction += std::fmod(increment, 1.0);
      double const extraIncrement = std::floor(fraction);
      auto const toAdd = std::min(static_cast<double>(m_capacity - m_tokens),
                                  std::floor(increment) + extraIncrement);
      fraction = std::fmod(fraction, 1.0);
      updatedAt = now;

      if (toAdd >= 1)
      {
        m_tokens += static_cast<size_t>(toAdd);
        m_tokenAdded.notify_all();
      }
    }

    m_closing.wait_for(lock, m_refillPeriod, [this] { return m_closed; });
  }

  LOG(LDEBUG, ("Rate limiter refill stopped"));
}
}  // namespace resolver
