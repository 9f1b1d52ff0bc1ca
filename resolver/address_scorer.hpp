#pragma once

#include "resolver/candidate.hpp"

#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace resolver
{
// Scores every candidate against |address| on its Chinese fields, attaches the
// similarity and stable sorts |candidates| by score, the highest first. Ties
// keep the order of the service.
// Returns the best candidate or boost::none when |candidates| is empty.
boost::optional<Candidate> ParseAddress(std::vector<Candidate> & candidates,
                                        std::string const & address);
}  // namespace resolver
