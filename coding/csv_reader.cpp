#include "coding/csv_reader.hpp"

#include "base/string_utils.hpp"

#include <algorithm>
#include <iterator>

namespace coding
{
namespace
{
char const kQuote = '"';
std::string const kUtf8Bom = "\xEF\xBB\xBF";
}  // namespace

CsvReader::CsvReader(std::string const & filePath, bool hasHeader, char delimiter)
  : m_fileStream(std::make_unique<std::ifstream>(filePath, std::ios::binary))
  , m_in(*m_fileStream)
  , m_delimiter(delimiter)
{
  if (!m_fileStream->is_open())
    MYTHROW(OpenException, ("Failed to open file", filePath));

  if (hasHeader)
    ReadHeader();
}

CsvReader::CsvReader(std::istream & stream, bool hasHeader, char delimiter)
  : m_in(stream), m_delimiter(delimiter)
{
  if (hasHeader)
    ReadHeader();
}

void CsvReader::ReadHeader()
{
  auto header = ReadRow();
  if (!header)
    MYTHROW(FormatException, ("No header in csv data"));

  if (!header->empty() && strings::StartsWith(header->front(), kUtf8Bom))
    header->front().erase(0, kUtf8Bom.size());

  m_header = std::move(*header);
}

boost::optional<CsvReader::Row> CsvReader::ReadRow()
{
  std::string line;
  if (!std::getline(m_in, line))
    return {};
  ++m_lineNumber;

  Row row;
  std::string field;
  bool quoted = false;
  size_t i = 0;
  while (true)
  {
    if (i == line.size())
    {
      if (!quoted)
        break;

      // A quoted field spans several physical lines.
      std::string next;
      if (!std::getline(m_in, next))
        MYTHROW(FormatException, ("Unterminated quoted field at line", m_lineNumber));
      ++m_lineNumber;
      field += '\n';
      line = std::move(next);
      i = 0;
      continue;
    }

    char const c = line[i++];
    if (quoted)
    {
      if (c != kQuote)
        field += c;
      else if (i < line.size() && line[i] == kQuote)
        field += line[i++];
      else
        quoted = false;
    }
    else if (c == kQuote)
    {
      quoted = true;
    }
    else if (c == m_delimiter)
    {
      row.push_back(std::move(field));
      field.clear();
    }
    else if (c != '\r' || i != line.size())
    {
      field += c;
    }
  }
  row.push_back(std::move(field));
  return row;
}

std::vector<std::string> ReadColumn(CsvReader & reader, std::string const & columnName)
{
  auto const & header = reader.GetHeader();
  auto const it = std::find(header.begin(), header.end(), columnName);
  if (it == header.end())
    MYTHROW(CsvReader::FormatException, ("No column", columnName, "in csv header", header));

  size_t const column = static_cast<size_t>(std::distance(header.begin(), it));

  std::vector<std::string> values;
  while (auto row = reader.ReadRow())
  {
    // A blank line has a single empty field.
    if (row->size() == 1 && row->front().empty())
      continue;
    values.push_back(column < row->size() ? std::move((*row)[column]) : std::string());
  }
  return values;
}
}  // namespace coding
