#include "resolver/als_lookup_service.hpp"

#include <string>

namespace resolver
{
// static
std::string const AlsLookupService::kDefaultUrl = "https://www.als.gov.hk/lookup";

AlsLookupService::AlsLookupService(Params const & params) : m_params(params) {}

std::string AlsLookupService::MakeUrl(std::string const & query) const
{
  auto url = m_params.m_url;
  url += url.find('?') == std::string::npos ? '?' : '&';
  url += "q=" + platform::HttpClient::UrlEncode(query);
  url += "&n=" + std::to_string(m_params.m_maxSuggestions);
  return url;
}

std::string AlsLookupService::Lookup(std::string const & query)
{
  platform::HttpClient request(MakeUrl(query));
  request.SetTimeout(m_params.m_timeoutSec).SetRawHeaders(m_headers);

  if (!request.RunHttpRequest())
    MYTHROW(LookupException, ("Request to", request.UrlRequested(), "failed:", request.ErrorMessage()));

  auto const status = request.ErrorCode();
  if (status < 200 || status >= 300)
    MYTHROW(LookupException, ("Request to", request.UrlRequested(), "returned http status", status));

  return request.ServerResponse();
}
}  // namespace resolver
