#pragma once

#include "resolver/address_fields.hpp"
#include "resolver/address_matcher.hpp"

#include "coding/json.hpp"

#include "base/exception.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace resolver
{
DECLARE_EXCEPTION(CandidateException, RootException);

// A single suggestion of the lookup service.
struct Candidate
{
  // Position in the suggestion list of the service, 0-based.
  size_t m_rank = 0;

  // "ChiPremisesAddress" and "EngPremisesAddress" of the suggestion.
  AddressNode m_chinese;
  AddressNode m_english;

  // "GeospatialInformation" serialized as json, not interpreted.
  std::string m_geo;

  // "ValidationInformation.Score" of the service.
  boost::optional<double> m_providerScore;

  // Attached by ParseAddress().
  boost::optional<Similarity> m_similarity;
};

// Flattens the "SuggestedAddress" array of a service response.
// Throws CandidateException if a suggestion lacks one of the required fields.
std::vector<Candidate> FlattenCandidates(coding::JsonValue const & suggestions);

std::string DebugPrint(Candidate const & candidate);
}  // namespace resolver
