#pragma once

#include "resolver/lookup_service.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace resolver
{
namespace tests_support
{
// Answers queries with |handler|. The handler gets the query and the 0-based
// number of the call for this query, and may throw LookupException.
class StubLookupService : public LookupService
{
public:
  using Handler = std::function<std::string(std::string const & query, size_t call)>;

  explicit StubLookupService(Handler handler) : m_handler(std::move(handler)) {}

  // LookupService overrides:
  std::string Lookup(std::string const & query) override
  {
    size_t call = 0;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      call = m_calls[query]++;
      ++m_totalCalls;
    }
    return m_handler(query, call);
  }

  size_t GetCalls(std::string const & query) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto const it = m_calls.find(query);
    return it == m_calls.end() ? 0 : it->second;
  }

  size_t GetTotalCalls() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalCalls;
  }

private:
  Handler m_handler;
  mutable std::mutex m_mutex;
  std::map<std::string, size_t> m_calls;
  size_t m_totalCalls = 0;
};

// A service response with the single suggestion built from the Chinese and
// the English structured addresses (json objects).
inline std::string MakeResponse(std::string const & chinese, std::string const & english,
                                std::string const & score = "87.5")
{
  return R"({"RequestAddress": {"AddressLine": []}, "SuggestedAddress": [{"Address": )"
         R"({"PremisesAddress": {"ChiPremisesAddress": )" + chinese +
         R"(, "EngPremisesAddress": )" + english +
         R"(, "GeospatialInformation": {"Northing": "816000", "Easting": "833000", )"
         R"("Latitude": "22.28", "Longitude": "114.15"}}}, )"
         R"("ValidationInformation": {"Score": )" + score + "}}]}";
}

inline std::string const & GetEmptyResponse()
{
  static std::string const kResponse = R"({"RequestAddress": {"AddressLine": ["nowhere"]}})";
  return kResponse;
}
}  // namespace tests_support
}  // namespace resolver
