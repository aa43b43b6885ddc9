#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace negotiation::db {

/*
  Filter expression "<path> <op> <value>".

  path is a dotted sequence of lowerCamelCase field names of
  ContractNegotiation, e.g. "contractAgreement.policy.assignee".
*/
struct Criterion {
  std::string operand_left;
  std::string op = "=";
  std::string operand_right;

  bool operator==(const Criterion&) const = default;
};

struct QuerySpec {
  std::vector<Criterion> filter;
  std::size_t            offset = 0;
  std::size_t            limit  = 50;

  bool operator==(const QuerySpec&) const = default;

  static QuerySpec None() {
    return {};
  }
};

} // namespace negotiation::db
