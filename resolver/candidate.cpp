#include "resolver/candidate.hpp"

#include "base/string_utils.hpp"

#include <sstream>

namespace resolver
{
namespace
{
boost::optional<double> ReadScore(coding::JsonValue const & score)
{
  if (score.IsNumber())
    return score.GetDouble();

  double value = 0;
  if (score.IsString() && strings::to_double(score.GetString(), value))
    return value;

  return {};
}

Candidate MakeCandidate(size_t rank, coding::JsonValue const & suggestion)
{
  auto const & premises =
      coding::GetJsonObligatoryFieldByPath(suggestion, "Address", "PremisesAddress");

  Candidate candidate;
  candidate.m_rank = rank;
  candidate.m_chinese =
      MakeAddressNode(coding::GetJsonObligatoryField(premises, "ChiPremisesAddress"));
  candidate.m_english =
      MakeAddressNode(coding::GetJsonObligatoryField(premises, "EngPremisesAddress"));
  candidate.m_geo =
      coding::ToJsonString(coding::GetJsonObligatoryField(premises, "GeospatialInformation"));
  candidate.m_providerScore = ReadScore(
      coding::GetJsonObligatoryFieldByPath(suggestion, "ValidationInformation", "Score"));
  return candidate;
}
}  // namespace

std::vector<Candidate> FlattenCandidates(coding::JsonValue const & suggestions)
{
  if (!suggestions.IsArray())
    MYTHROW(CandidateException, ("Suggestions must be a json array"));

  std::vector<Candidate> candidates;
  candidates.reserve(suggestions.Size());
  for (rapidjson::SizeType i = 0; i < suggestions.Size(); ++i)
  {
    try
    {
      candidates.push_back(MakeCandidate(i, suggestions[i]));
    }
    catch (coding::JsonException const & e)
    {
      MYTHROW(CandidateException, ("Suggestion", i, ":", e.Msg()));
    }
    catch (AddressFieldsException const & e)
    {
      MYTHROW(CandidateException, ("Suggestion", i, ":", e.Msg()));
    }
  }
  return candidates;
}

std::string DebugPrint(Candidate const & candidate)
{
  std::ostringstream out;
  out << "Candidate [ rank: " << candidate.m_rank << ", chi: " << DebugPrint(candidate.m_chinese)
      << ", eng: " << DebugPrint(candidate.m_english) << ", geo: " << candidate.m_geo
      << ", score: " << ::DebugPrint(candidate.m_providerScore) << " ]";
  return out.str();
}
}  // namespace resolver
