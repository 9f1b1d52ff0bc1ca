#include "resolver/output_record.hpp"

#include <cmath>
#include <cstddef>
#include <sstream>

using namespace std;

namespace resolver
{
namespace
{
enum class Language
{
  Chinese,
  English
};

struct Column
{
  char const * m_name;
  Language m_language;
  vector<string> m_path;
  string OutputRecord::*m_field;
};

// Columns taken from the structured addresses of the candidate.
vector<Column> const & GetSchema()
{
  static vector<Column> const kSchema = {
      {"CHI_Region", Language::Chinese, {"Region"}, &OutputRecord::m_chiRegion},
      {"chi_district", Language::Chinese, {"ChiDistrict", "DcDistrict"},
       &OutputRecord::m_chiDistrict},
      {"chi_estate", Language::Chinese, {"ChiEstate", "EstateName"}, &OutputRecord::m_chiEstate},
      {"OGCIO_CHI_BuildingName", Language::Chinese, {"BuildingName"},
       &OutputRecord::m_chiBuildingName},
      {"OGCIO_CHI_StreetName", Language::Chinese, {kChiStreet, kStreetName},
       &OutputRecord::m_chiStreetName},
      {"OGCIO_CHI_BuildingNo", Language::Chinese, {kChiStreet, kBuildingNoFrom},
       &OutputRecord::m_chiBuildingNo},
      {"OGCIO_CHI_Block", Language::Chinese, {"ChiBlock", "BlockNo"}, &OutputRecord::m_chiBlock},
      {"OGCIO_ENG_Region", Language::English, {"Region"}, &OutputRecord::m_engRegion},
      {"OGCIO_ENG_District", Language::English, {"EngDistrict", "DcDistrict"},
       &OutputRecord::m_engDistrict},
      {"OGCIO_ENG_Estate", Language::English, {"EngEstate", "EstateName"},
       &OutputRecord::m_engEstate},
      {"OGCIO_ENG_BuildingName", Language::English, {"BuildingName"},
       &OutputRecord::m_engBuildingName},
      {"OGCIO_ENG_StreetName", Language::English, {"EngStreet", kStreetName},
       &OutputRecord::m_engStreetName},
      {"OGCIO_ENG_BuildingNo", Language::English, {"EngStreet", kBuildingNoFrom},
       &OutputRecord::m_engBuildingNo},
      {"OGCIO_ENG_Block", Language::English, {"EngBlock", "BlockNo"}, &OutputRecord::m_engBlock},
  };
  return kSchema;
}

string FormatScore(double score)
{
  ostringstream out;
  out << score;
  return out.str();
}
}  // namespace

OutputRecord MakeOutputRecord(Candidate const & candidate, string const & address)
{
  OutputRecord record;
  record.m_inputAddress = address;
  if (candidate.m_providerScore && std::isfinite(*candidate.m_providerScore))
    record.m_score = static_cast<int>(*candidate.m_providerScore);
  if (candidate.m_similarity)
    record.m_matchScore = candidate.m_similarity->GetScore();

  for (auto const & column : GetSchema())
  {
    auto const & node =
        column.m_language == Language::Chinese ? candidate.m_chinese : candidate.m_english;
    record.*column.m_field = node.GetString(column.m_path).value_or(string());
  }
  return record;
}

vector<string> const & GetOutputColumns()
{
  static vector<string> const kColumns = [] {
    vector<string> columns = {"input_address", "score"};
    for (auto const & column : GetSchema())
      columns.emplace_back(column.m_name);
    columns.emplace_back("match_score");
    return columns;
  }();
  return kColumns;
}

vector<string> ToRow(OutputRecord const & record)
{
  vector<string> row = {record.m_inputAddress, to_string(record.m_score)};
  for (auto const & column : GetSchema())
    row.push_back(record.*column.m_field);
  row.push_back(FormatScore(record.m_matchScore));
  return row;
}

string DebugPrint(OutputRecord const & record)
{
  auto const & columns = GetOutputColumns();
  auto const row = ToRow(record);

  ostringstream out;
  out << "OutputRecord [ ";
  for (size_t i = 0; i < columns.size(); ++i)
    out << (i == 0 ? "" : ", ") << columns[i] << ": " << row[i];
  out << " ]";
  return out.str();
}
}  // namespace resolver
