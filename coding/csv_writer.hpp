#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace coding
{
class CsvWriter
{
public:
  using Row = std::vector<std::string>;

  explicit CsvWriter(std::ostream & out, char delimiter = ',');

  // Quotes a field only when it contains the delimiter, a quote or a line break.
  void WriteRow(Row const & row);

private:
  void WriteField(std::string const & field);

  std::ostream & m_out;
  char m_delimiter;
};
}  // namespace coding
