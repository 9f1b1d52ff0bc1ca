#pragma once

#include "resolver/candidate.hpp"

#include <string>
#include <vector>

namespace resolver
{
// A resolved address as written to the output table. Absent fields of the
// candidate are empty strings.
struct OutputRecord
{
  std::string m_inputAddress;
  // Validation score of the service truncated to an integer.
  int m_score = 0;

  std::string m_chiRegion;
  std::string m_chiDistrict;
  std::string m_chiEstate;
  std::string m_chiBuildingName;
  std::string m_chiStreetName;
  std::string m_chiBuildingNo;
  std::string m_chiBlock;

  std::string m_engRegion;
  std::string m_engDistrict;
  std::string m_engEstate;
  std::string m_engBuildingName;
  std::string m_engStreetName;
  std::string m_engBuildingNo;
  std::string m_engBlock;

  // Similarity score of the chosen candidate.
  double m_matchScore = 0.0;
};

OutputRecord MakeOutputRecord(Candidate const & candidate, std::string const & address);

// Column names of the output table, in order.
std::vector<std::string> const & GetOutputColumns();

// Cells of |record| in the order of GetOutputColumns().
std::vector<std::string> ToRow(OutputRecord const & record);

std::string DebugPrint(OutputRecord const & record);
}  // namespace resolver
