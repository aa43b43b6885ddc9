#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "internal/db/api/query.hpp"

namespace negotiation::query {

/*
  Filter path handling for negotiation queries.

  A path is a dotted sequence of lowerCamelCase (protobuf json_name) field
  names. Resolution is case-sensitive and must end at a scalar or enum field.
  Below a google.protobuf.Struct any non-empty key is accepted.
*/

// Parses "path=value", "path!=value", "path in (a,b)", "path like a%".
std::optional<db::Criterion> ParseCriterion(std::string_view expression);

bool IsSupportedOperator(std::string_view op);

// Returns the reason when `path` does not resolve against `root`.
std::optional<std::string> ValidatePath(const google::protobuf::Descriptor* root, std::string_view path);

// True when any value found at the criterion's path satisfies it.
bool Matches(const google::protobuf::Message& message, const db::Criterion& criterion);

} // namespace negotiation::query
