#pragma once

#include <string>

namespace resolver
{
// Removes the floor, unit, shop, basement or podium part of |address| together
// with everything that follows it, e.g. "彌敦道594號3樓A室" -> "彌敦道594號".
// Returns |address| unchanged when there is no such part.
std::string RemoveFloor(std::string const & address);
}  // namespace resolver
