#pragma once

#include "base/exception.hpp"

#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace coding
{
// Reads RFC 4180 style CSV: fields may be quoted with '"', quoted fields may
// contain delimiters, line breaks and doubled quotes.
class CsvReader
{
public:
  using Row = std::vector<std::string>;

  DECLARE_EXCEPTION(Exception, RootException);
  DECLARE_EXCEPTION(OpenException, Exception);
  DECLARE_EXCEPTION(FormatException, Exception);

  explicit CsvReader(std::string const & filePath, bool hasHeader = true, char delimiter = ',');
  explicit CsvReader(std::istream & stream, bool hasHeader = true, char delimiter = ',');

  Row const & GetHeader() const { return m_header; }

  // Returns boost::none at the end of the stream.
  boost::optional<Row> ReadRow();

  // Number of the physical line the last row ended on, 1-based.
  size_t GetCurrentLineNumber() const { return m_lineNumber; }

private:
  void ReadHeader();

  std::unique_ptr<std::ifstream> m_fileStream;
  std::istream & m_in;
  char m_delimiter;
  Row m_header;
  size_t m_lineNumber = 0;
};

// Reads all the values of the column named |columnName|.
// Throws CsvReader::FormatException if there is no such column.
std::vector<std::string> ReadColumn(CsvReader & reader, std::string const & columnName);
}  // namespace coding
