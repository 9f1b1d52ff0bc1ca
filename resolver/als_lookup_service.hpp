#pragma once

#include "resolver/lookup_service.hpp"

#include "platform/http_client.hpp"

#include <cstddef>
#include <string>

namespace resolver
{
// Lookup against the Address Lookup Service of the Hong Kong government,
// https://www.als.gov.hk.
class AlsLookupService : public LookupService
{
public:
  static std::string const kDefaultUrl;

  struct Params
  {
    std::string m_url = kDefaultUrl;
    // Value of the "n" request parameter: the maximal number of suggestions.
    size_t m_maxSuggestions = 1;
    double m_timeoutSec = 30.0;
  };

  AlsLookupService() = default;
  explicit AlsLookupService(Params const & params);

  // LookupService overrides:
  std::string Lookup(std::string const & query) override;

  std::string MakeUrl(std::string const & query) const;

private:
  Params m_params;
  platform::HttpClient::Headers m_headers = {{"Accept", "application/json"},
                                             {"Accept-Language", "en,zh-Hant"},
                                             {"Accept-Encoding", "gzip"}};
};
}  // namespace resolver
