#pragma once

#include "coding/json.hpp"

#include "base/exception.hpp"

#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace resolver
{
char const kChiStreet[] = "ChiStreet";
char const kChiVillage[] = "ChiVillage";
char const kStreetName[] = "StreetName";
char const kVillageName[] = "VillageName";
char const kBuildingNoFrom[] = "BuildingNoFrom";
char const kBuildingNoTo[] = "BuildingNoTo";

DECLARE_EXCEPTION(AddressFieldsException, RootException);

// A street or a village together with its building number range, e.g.
// {"StreetName": "彌敦道", "BuildingNoFrom": "594", "BuildingNoTo": "596"}.
struct StreetField
{
  // kStreetName or kVillageName.
  std::string m_nameKey;
  std::string m_name;
  boost::optional<std::string> m_buildingNoFrom;
  boost::optional<std::string> m_buildingNoTo;
};

class AddressNode;

// A value of the structured address: a plain string, a street (village) with
// building numbers, or a nested group of fields.
using AddressValue =
    boost::variant<std::string, StreetField, boost::recursive_wrapper<AddressNode>>;

// An ordered group of named address fields, e.g. the "ChiPremisesAddress" of a
// suggestion. The order of the service response is preserved.
class AddressNode
{
public:
  using Field = std::pair<std::string, AddressValue>;

  void Add(std::string const & key, AddressValue && value);

  std::vector<Field> const & GetFields() const { return m_fields; }
  bool IsEmpty() const { return m_fields.empty(); }

  // Returns the string at |path|, e.g. {"ChiStreet", "BuildingNoFrom"}, or
  // boost::none if there is no such string.
  boost::optional<std::string> GetString(std::vector<std::string> const & path) const;

private:
  AddressValue const * Find(std::string const & key) const;

  std::vector<Field> m_fields;
};

// Builds the tree from the json object |json|. kChiStreet and kChiVillage
// objects become StreetField values, values which are neither strings nor
// objects are dropped.
// Throws AddressFieldsException if |json| is not an object or a street has
// no name.
AddressNode MakeAddressNode(coding::JsonValue const & json);

std::string DebugPrint(StreetField const & street);
std::string DebugPrint(AddressNode const & node);
}  // namespace resolver
