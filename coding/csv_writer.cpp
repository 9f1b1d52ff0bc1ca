#include "coding/csv_writer.hpp"

namespace coding
{
CsvWriter::CsvWriter(std::ostream & out, char delimiter) : m_out(out), m_delimiter(delimiter) {}

void CsvWriter::WriteRow(Row const & row)
{
  for (size_t i = 0; i < row.size(); ++i)
  {
    if (i != 0)
      m_out << m_delimiter;
    WriteField(row[i]);
  }
  m_out << '\n';
}

void CsvWriter::WriteField(std::string const & field)
{
  std::string const special = {m_delimiter, '"', '\n', '\r'};
  if (field.find_first_of(special) == std::string::npos)
  {
    m_out << field;
    return;
  }

  m_out << '"';
  for (char const c : field)
  {
    if (c == '"')
      m_out << '"';
    m_out << c;
  }
  m_out << '"';
}
}  // namespace coding
