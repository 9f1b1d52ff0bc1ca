#include "resolver/address_resolver.hpp"
#include "resolver/address_table.hpp"
#include "resolver/als_lookup_service.hpp"

#include "base/exception.hpp"
#include "base/gmtime.hpp"
#include "base/logging.hpp"
#include "base/string_utils.hpp"
#include "base/timer.hpp"

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using namespace resolver;
using namespace std;

namespace fs = boost::filesystem;
namespace po = boost::program_options;

namespace
{
char const kOutputFileName[] = "scanned_addresses.csv";
char const kLogFileName[] = "addresses_fetcher.log";

mutex g_logMutex;
ofstream g_logFile;

void LogMessageToFile(base::LogLevel level, base::SrcPoint const & srcPoint, string const & msg)
{
  ostringstream out;
  out << base::GmTimeNowString() << " " << base::ToString(level) << " " << DebugPrint(srcPoint)
      << msg << "\n";

  lock_guard<mutex> lock(g_logMutex);
  cerr << out.str();
  if (g_logFile.is_open())
    g_logFile << out.str() << flush;
}

struct CliCommandOptions
{
  string m_inputPath;
  string m_outputPath;
  string m_logPath;
  // Signed, so that a negative index is reported instead of wrapped around.
  boost::optional<int64_t> m_startIndex;
  boost::optional<int64_t> m_stopIndex;
  string m_url;
  size_t m_maxSuggestions = 1;
  double m_rateLimit = 20.0;
  size_t m_maxInFlight = 20;
  size_t m_threads = 0;
  size_t m_maxRetries = 10;
  double m_sleepMultiplier = 2.0;
  double m_timeoutSec = 30.0;
  string m_logLevel;
};

bool DefineOptions(int argc, char * argv[], CliCommandOptions & o)
{
  po::options_description optionsDescription("Resolves free-form Hong Kong addresses with ALS");

  auto const levels = strings::JoinStrings(base::GetLogLevelNames(), ", ");

  optionsDescription.add_options()
    ("input_path", po::value(&o.m_inputPath)->required(), "Path to the csv file with the \"address\" column")
    ("output_path", po::value(&o.m_outputPath)->default_value("."), "Directory for scanned_addresses.csv")
    ("log_path", po::value(&o.m_logPath)->default_value("."), "Directory for addresses_fetcher.log")
    ("start_index", po::value(&o.m_startIndex), "First row to query, used together with stop_index")
    ("stop_index", po::value(&o.m_stopIndex), "Row to stop queries at (exclusive), used together with start_index")
    ("url", po::value(&o.m_url)->default_value(AlsLookupService::kDefaultUrl), "Address lookup service url")
    ("max_suggestions", po::value(&o.m_maxSuggestions)->default_value(1), "Number of suggestions requested per address")
    ("rate_limit", po::value(&o.m_rateLimit)->default_value(20.0), "Maximal number of requests per second")
    ("max_in_flight", po::value(&o.m_maxInFlight)->default_value(20), "Maximal number of simultaneous requests")
    ("threads", po::value(&o.m_threads)->default_value(0), "Number of worker threads, 0 to use max_in_flight")
    ("max_retries", po::value(&o.m_maxRetries)->default_value(10), "Maximal number of attempts per address")
    ("sleep_multiplier", po::value(&o.m_sleepMultiplier)->default_value(2.0), "Backoff multiplier, seconds")
    ("timeout", po::value(&o.m_timeoutSec)->default_value(30.0), "Timeout of a single request, seconds")
    ("log_level", po::value(&o.m_logLevel)->default_value("INFO"), ("One of: " + levels).c_str())
    ("help", "produce help message");

  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, optionsDescription), vm);

  if (vm.count("help"))
  {
    cout << optionsDescription << endl;
    return false;
  }

  po::notify(vm);
  return true;
}

bool CheckOptions(CliCommandOptions const & o)
{
  if (o.m_maxInFlight == 0)
  {
    cerr << "ERROR: max_in_flight must be positive" << endl;
    return false;
  }
  if (o.m_maxSuggestions == 0)
  {
    cerr << "ERROR: max_suggestions must be positive" << endl;
    return false;
  }
  try
  {
    MakeRowRange(o.m_startIndex, o.m_stopIndex);
  }
  catch (RowRangeException const & e)
  {
    cerr << "ERROR: " << e.Msg() << endl;
    return false;
  }
  return true;
}

int Run(CliCommandOptions const & o)
{
  AlsLookupService::Params serviceParams;
  serviceParams.m_url = o.m_url;
  serviceParams.m_maxSuggestions = o.m_maxSuggestions;
  serviceParams.m_timeoutSec = o.m_timeoutSec;
  AlsLookupService service(serviceParams);

  ResolverParams params;
  params.m_rateLimit = o.m_rateLimit;
  params.m_threads = o.m_threads;
  params.m_fetcher.m_maxInFlight = o.m_maxInFlight;
  params.m_fetcher.m_maxRetries = o.m_maxRetries;
  params.m_fetcher.m_sleepMultiplier = o.m_sleepMultiplier;
  AddressResolver resolver(service, params);

  auto const addresses =
      ReadAddresses(o.m_inputPath, MakeRowRange(o.m_startIndex, o.m_stopIndex));
  LOG(LINFO, ("Amount of addresses:", addresses.size()));

  base::Timer timer;
  auto const records = resolver.Resolve(addresses);
  LOG(LINFO, ("Fetching from", o.m_url, "takes:", timer.ElapsedSeconds(), "secs, of len =",
              addresses.size()));

  auto const outputPath = (fs::path(o.m_outputPath) / kOutputFileName).string();
  ofstream out(outputPath);
  if (!out.is_open())
  {
    LOG(LERROR, ("Can't open", outputPath));
    return 1;
  }
  WriteRecords(out, records);
  out.close();
  if (out.fail())
  {
    LOG(LERROR, ("Failed to write", outputPath));
    return 1;
  }

  LOG(LINFO, ("Written", records.size(), "records to", outputPath));
  return 0;
}
}  // namespace

int main(int argc, char * argv[])
{
  CliCommandOptions options;
  try
  {
    if (!DefineOptions(argc, argv, options))
      return 0;
  }
  catch (po::error & e)
  {
    cerr << "ERROR: " << e.what() << endl << endl;
    return 1;
  }

  if (!CheckOptions(options))
    return 1;

  base::LogLevel level;
  if (!base::FromString(options.m_logLevel, level))
  {
    cerr << "ERROR: unknown log level " << options.m_logLevel << endl;
    return 1;
  }
  base::g_LogLevel = level;

  auto const logPath = (fs::path(options.m_logPath) / kLogFileName).string();
  g_logFile.open(logPath, ios::out | ios::trunc);
  if (!g_logFile.is_open())
    cerr << "WARNING: can't open " << logPath << ", logging to stderr only" << endl;
  base::SetLogMessageFn(&LogMessageToFile);

  try
  {
    return Run(options);
  }
  catch (RateLimiter::ConfigException const & e)
  {
    LOG(LERROR, ("Bad configuration:", e.Msg()));
  }
  catch (RootException const & e)
  {
    LOG(LERROR, (e.what()));
  }
  return 1;
}
