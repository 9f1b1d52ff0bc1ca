#include "resolver/address_fields.hpp"

#include <sstream>

namespace resolver
{
namespace
{
boost::optional<std::string> GetStringField(coding::JsonValue const & json, char const * key)
{
  auto const & value = coding::GetJsonOptionalField(json, key);
  if (!value.IsString())
    return {};
  return std::string(value.GetString(), value.GetStringLength());
}

StreetField MakeStreetField(std::string const & key, coding::JsonValue const & json)
{
  if (!json.IsObject())
    MYTHROW(AddressFieldsException, (key, "is not an object"));

  StreetField street;
  for (auto const * nameKey : {kStreetName, kVillageName})
  {
    if (auto name = GetStringField(json, nameKey))
    {
      street.m_nameKey = nameKey;
      street.m_name = std::move(*name);
    }
  }
  if (street.m_nameKey.empty())
    MYTHROW(AddressFieldsException, (key, "has neither", kStreetName, "nor", kVillageName));

  street.m_buildingNoFrom = GetStringField(json, kBuildingNoFrom);
  street.m_buildingNoTo = GetStringField(json, kBuildingNoTo);
  return street;
}

class DebugPrinter : public boost::static_visitor<std::string>
{
public:
  std::string operator()(std::string const & s) const { return s; }
  std::string operator()(StreetField const & street) const { return DebugPrint(street); }
  std::string operator()(AddressNode const & node) const { return DebugPrint(node); }
};
}  // namespace

void AddressNode::Add(std::string const & key, AddressValue && value)
{
  m_fields.emplace_back(key, std::move(value));
}

AddressValue const * AddressNode::Find(std::string const & key) const
{
  for (auto const & field : m_fields)
  {
    if (field.first == key)
      return &field.second;
  }
  return nullptr;
}

boost::optional<std::string> AddressNode::GetString(std::vector<std::string> const & path) const
{
  AddressNode const * node = this;
  for (size_t i = 0; i < path.size(); ++i)
  {
    auto const * value = node->Find(path[i]);
    if (!value)
      return {};

    bool const isLast = i + 1 == path.size();
    if (auto const * s = boost::get<std::string>(value))
      return isLast ? boost::make_optional(*s) : boost::none;

    if (auto const * street = boost::get<StreetField>(value))
    {
      if (i + 2 != path.size())
        return {};
      auto const & subKey = path.back();
      if (subKey == street->m_nameKey)
        return street->m_name;
      if (subKey == kBuildingNoFrom)
        return street->m_buildingNoFrom;
      if (subKey == kBuildingNoTo)
        return street->m_buildingNoTo;
      return {};
    }

    node = boost::get<AddressNode>(value);
  }
  return {};
}

AddressNode MakeAddressNode(coding::JsonValue const & json)
{
  if (!json.IsObject())
    MYTHROW(AddressFieldsException, ("Structured address is not an object"));

  AddressNode node;
  for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it)
  {
    std::string const key(it->name.GetString(), it->name.GetStringLength());
    auto const & value = it->value;

    if (key == kChiStreet || key == kChiVillage)
      node.Add(key, MakeStreetField(key, value));
    else if (value.IsObject())
      node.Add(key, MakeAddressNode(value));
    else if (value.IsString())
      node.Add(key, std::string(value.GetString(), value.GetStringLength()));
  }
  return node;
}

std::string DebugPrint(StreetField const & street)
{
  std::ostringstream out;
  out << "StreetField [ " << street.m_nameKey << ": " << street.m_name;
  if (street.m_buildingNoFrom)
    out << ", " << kBuildingNoFrom << ": " << *street.m_buildingNoFrom;
  if (street.m_buildingNoTo)
    out << ", " << kBuildingNoTo << ": " << *street.m_buildingNoTo;
  out << " ]";
  return out.str();
}

std::string DebugPrint(AddressNode const & node)
{
  std::ostringstream out;
  out << "{";
  auto const * delimiter = "";
  for (auto const & field : node.GetFields())
  {
    out << delimiter << field.first << ": " << boost::apply_visitor(DebugPrinter(), field.second);
    delimiter = ", ";
  }
  out << "}";
  return out.str();
}
}  // namespace resolver
