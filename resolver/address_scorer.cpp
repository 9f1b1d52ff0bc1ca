#include "resolver/address_scorer.hpp"

#include "resolver/address_matcher.hpp"

#include "base/logging.hpp"

#include <algorithm>

namespace resolver
{
boost::optional<Candidate> ParseAddress(std::vector<Candidate> & candidates,
                                        std::string const & address)
{
  if (candidates.empty())
    return {};

  for (auto & candidate : candidates)
  {
    candidate.m_similarity = GetSimilarity(address, candidate.m_chinese);
    LOG(LDEBUG, ("Candidate", candidate.m_rank, "of", address, ":", *candidate.m_similarity));
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](Candidate const & lhs, Candidate const & rhs) {
                     return lhs.m_similarity->GetScore() > rhs.m_similarity->GetScore();
                   });

  return candidates.front();
}
}  // namespace resolver
