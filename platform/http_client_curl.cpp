#include "platform/http_client.hpp"

#include "base/logging.hpp"

#include <cctype>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

#include <curl/curl.h>

namespace platform
{
namespace
{
std::string const kAcceptEncoding = "Accept-Encoding";

void GlobalInitCurl()
{
  static std::once_flag initFlag;
  std::call_once(initFlag, [] {
    CURLcode const code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK)
      LOG(LERROR, ("curl_global_init failed:", curl_easy_strerror(code)));
  });
}

size_t WriteToString(char * contents, size_t size, size_t nmemb, void * userData)
{
  auto * out = static_cast<std::string *>(userData);
  out->append(contents, size * nmemb);
  return size * nmemb;
}

struct CurlDeleter
{
  void operator()(CURL * curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter
{
  void operator()(curl_slist * list) const { curl_slist_free_all(list); }
};
}  // namespace

constexpr int HttpClient::kNoError;

HttpClient::HttpClient(std::string const & url) : m_urlRequested(url) {}

HttpClient & HttpClient::SetTimeout(double timeoutSec)
{
  m_timeoutSec = timeoutSec;
  return *this;
}

HttpClient & HttpClient::SetRawHeaders(Headers const & headers)
{
  m_headers.insert(m_headers.end(), headers.begin(), headers.end());
  return *this;
}

bool HttpClient::RunHttpRequest()
{
  GlobalInitCurl();

  m_errorCode = kNoError;
  m_serverResponse.clear();
  m_errorMessage.clear();

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl)
  {
    m_errorMessage = "curl_easy_init failed";
    return false;
  }

  // curl decodes the body itself when it negotiates the encoding, so
  // Accept-Encoding is not passed as a raw header.
  std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
  std::string acceptEncoding;
  for (auto const & header : m_headers)
  {
    if (header.first == kAcceptEncoding)
    {
      acceptEncoding = header.second;
      continue;
    }
    std::string const line = header.first + ": " + header.second;
    headers.reset(curl_slist_append(headers.release(), line.c_str()));
  }

  CURL * handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, m_urlRequested.c_str());
  curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeoutSec * 1000));
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &WriteToString);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &m_serverResponse);
  if (!acceptEncoding.empty())
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, acceptEncoding.c_str());

  CURLcode const code = curl_easy_perform(handle);
  if (code != CURLE_OK)
  {
    m_errorMessage = curl_easy_strerror(code);
    return false;
  }

  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  m_errorCode = static_cast<int>(status);
  return true;
}

// static
std::string HttpClient::UrlEncode(std::string const & component)
{
  std::ostringstream out;
  out << std::hex << std::uppercase;
  for (unsigned char const c : component)
  {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
      out << c;
    else
      out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return out.str();
}
}  // namespace platform
