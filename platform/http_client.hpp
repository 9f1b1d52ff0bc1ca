#pragma once

#include "base/macros.hpp"

#include <string>
#include <utility>
#include <vector>

namespace platform
{
// Blocking HTTP GET client. One instance issues one request at a time; separate
// instances may run concurrently from different threads.
class HttpClient
{
public:
  static auto constexpr kNoError = -1;

  using Headers = std::vector<std::pair<std::string, std::string>>;

  explicit HttpClient(std::string const & url);

  // Note: if RunHttpRequest() returns true it means that the response was
  // received, ErrorCode() then holds the http status. On false, ErrorMessage()
  // describes the transport failure.
  bool RunHttpRequest();

  HttpClient & SetTimeout(double timeoutSec);
  HttpClient & SetRawHeaders(Headers const & headers);

  std::string const & UrlRequested() const { return m_urlRequested; }
  // Http status code or kNoError if the server did not answer.
  int ErrorCode() const { return m_errorCode; }
  std::string const & ServerResponse() const { return m_serverResponse; }
  std::string const & ErrorMessage() const { return m_errorMessage; }

  // Percent-encodes everything except RFC 3986 unreserved characters.
  static std::string UrlEncode(std::string const & component);

private:
  std::string m_urlRequested;
  double m_timeoutSec = 30.0;
  Headers m_headers;

  int m_errorCode = kNoError;
  std::string m_serverResponse;
  std::string m_errorMessage;

  DISALLOW_COPY_AND_MOVE(HttpClient);
};
}  // namespace platform
