#include "resolver/address_table.hpp"

#include "coding/csv_reader.hpp"
#include "coding/csv_writer.hpp"

#include "base/logging.hpp"

#include <algorithm>
#include <iterator>

namespace resolver
{
namespace
{
std::vector<std::string> ReadAddresses(coding::CsvReader & reader, RowRange const & range)
{
  auto cells = coding::ReadColumn(reader, kAddressColumn);

  if (range.m_start && range.m_stop)
  {
    size_t const stop = std::min(*range.m_stop, cells.size());
    size_t const start = std::min(*range.m_start, stop);
    LOG(LINFO, ("Taking rows [", start, ",", stop, ") of", cells.size()));
    cells = std::vector<std::string>(std::make_move_iterator(cells.begin() + start),
                                     std::make_move_iterator(cells.begin() + stop));
  }

  std::vector<std::string> addresses;
  addresses.reserve(cells.size());
  for (auto & cell : cells)
  {
    if (!cell.empty())
      addresses.push_back(std::move(cell));
  }

  if (addresses.size() != cells.size())
    LOG(LINFO, ("Skipped", cells.size() - addresses.size(), "empty addresses"));
  return addresses;
}
}  // namespace

RowRange MakeRowRange(boost::optional<int64_t> const & start, boost::optional<int64_t> const & stop)
{
  if ((start && *start < 0) || (stop && *stop < 0))
    MYTHROW(RowRangeException, ("Row indices must not be negative, got", start, stop));

  RowRange range;
  if (start)
    range.m_start = static_cast<size_t>(*start);
  if (stop)
    range.m_stop = static_cast<size_t>(*stop);
  return range;
}

std::vector<std::string> ReadAddresses(std::istream & in, RowRange const & range)
{
  coding::CsvReader reader(in);
  return ReadAddresses(reader, range);
}

std::vector<std::string> ReadAddresses(std::string const & path, RowRange const & range)
{
  coding::CsvReader reader(path);
  return ReadAddresses(reader, range);
}

void WriteRecords(std::ostream & out, std::vector<OutputRecord> const & records)
{
  coding::CsvWriter writer(out);
  writer.WriteRow(GetOutputColumns());
  for (auto const & record : records)
    writer.WriteRow(ToRow(record));
}
}  // namespace resolver
