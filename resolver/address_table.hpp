#pragma once

#include "resolver/output_record.hpp"

#include "base/exception.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace resolver
{
char const kAddressColumn[] = "address";

// Rows [start, stop) of the data rows, applied only when both bounds are given.
struct RowRange
{
  boost::optional<size_t> m_start;
  boost::optional<size_t> m_stop;
};

DECLARE_EXCEPTION(RowRangeException, RootException);

// Builds a RowRange from command line indices.
// Throws RowRangeException if an index is negative.
RowRange MakeRowRange(boost::optional<int64_t> const & start, boost::optional<int64_t> const & stop);

// Reads the "address" column of a csv table with a header. Rows outside of
// |range| and empty cells are skipped.
// Throws coding::CsvReader::Exception on bad input.
std::vector<std::string> ReadAddresses(std::istream & in, RowRange const & range);
std::vector<std::string> ReadAddresses(std::string const & path, RowRange const & range);

// Writes |records| as a csv table with the GetOutputColumns() header.
void WriteRecords(std::ostream & out, std::vector<OutputRecord> const & records);
}  // namespace resolver
