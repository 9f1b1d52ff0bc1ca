#pragma once

#include "base/exception.hpp"
#include "base/macros.hpp"

#define RAPIDJSON_HAS_STDSTRING 1
#define RAPIDJSON_HAS_CXX11_TYPETRAITS 1

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <utility>

namespace coding
{
DECLARE_EXCEPTION(JsonException, RootException);

using JsonValue = rapidjson::Value;
using JsonDocument = rapidjson::Document;
using JsonParseResult = rapidjson::ParseResult;

// Parses |text| into |document|, throws JsonException with the parser's
// diagnostics on malformed input.
inline void ParseJson(std::string const & text, JsonDocument & document)
{
  JsonParseResult const result = document.Parse(text.c_str(), text.size());
  if (!result)
  {
    MYTHROW(coding::JsonException, ("Malformed json at offset", result.Offset(), ":",
                                    rapidjson::GetParseError_En(result.Code())));
  }
}

inline std::string ToJsonString(JsonValue const & value)
{
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  value.Accept(writer);
  return std::string(buffer.GetString(), buffer.GetSize());
}

static const coding::JsonValue nullValue;

inline coding::JsonValue const & GetJsonOptionalField(coding::JsonValue const & root,
                                                      std::string const & field)
{
  if (!root.IsObject())
    MYTHROW(coding::JsonException, ("Bad json object while parsing", field));

  coding::JsonValue::ConstMemberIterator it = root.FindMember(field);

  if (it == root.MemberEnd())
    return nullValue;

  return it->value;
}

inline coding::JsonValue const & GetJsonObligatoryField(coding::JsonValue const & root,
                                                        std::string const & field)
{
  coding::JsonValue const & value = GetJsonOptionalField(root, field);
  if (value.IsNull())
    MYTHROW(coding::JsonException, ("Obligatory field", field, "is absent."));

  return value;
}

template <class First>
inline coding::JsonValue const & GetJsonObligatoryFieldByPath(coding::JsonValue const & root,
                                                              First && path)
{
  return GetJsonObligatoryField(root, std::forward<First>(path));
}

template <class First, class... Paths>
inline coding::JsonValue const & GetJsonObligatoryFieldByPath(coding::JsonValue const & root,
                                                              First && path, Paths &&... paths)
{
  coding::JsonValue const & newRoot = GetJsonObligatoryFieldByPath(root, std::forward<First>(path));
  return GetJsonObligatoryFieldByPath(newRoot, std::forward<Paths>(paths)...);
}
}  // namespace coding
