#include "internal/query/field_path.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace negotiation::query {

namespace {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using google::protobuf::Reflection;

constexpr std::string_view kStructTypeName = "google.protobuf.Struct";

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string_view> Split(std::string_view s, char delimiter) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = s.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

const FieldDescriptor* FindByJsonName(const Descriptor* descriptor, std::string_view name) {
  for (int i = 0; i < descriptor->field_count(); ++i) {
    const auto* field = descriptor->field(i);
    if (field->json_name() == name) {
      return field;
    }
  }
  return nullptr;
}

bool IsStruct(const FieldDescriptor* field) {
  return field->message_type() != nullptr && field->message_type()->full_name() == kStructTypeName;
}

std::string FormatNumber(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

void CollectStructValues(const google::protobuf::Value& value, const std::vector<std::string_view>& segments, std::size_t index,
                         std::vector<std::string>& out) {
  if (index == segments.size()) {
    switch (value.kind_case()) {
      case google::protobuf::Value::kStringValue:
        out.push_back(value.string_value());
        break;
      case google::protobuf::Value::kNumberValue:
        out.push_back(FormatNumber(value.number_value()));
        break;
      case google::protobuf::Value::kBoolValue:
        out.emplace_back(value.bool_value() ? "true" : "false");
        break;
      case google::protobuf::Value::kListValue:
        for (const auto& item : value.list_value().values()) CollectStructValues(item, segments, index, out);
        break;
      default:
        break;
    }
    return;
  }

  if (value.kind_case() == google::protobuf::Value::kStructValue) {
    const auto& fields = value.struct_value().fields();
    const auto  it     = fields.find(std::string(segments[index]));
    if (it != fields.end()) CollectStructValues(it->second, segments, index + 1, out);
  } else if (value.kind_case() == google::protobuf::Value::kListValue) {
    for (const auto& item : value.list_value().values()) CollectStructValues(item, segments, index, out);
  }
}

void CollectScalar(const Message& message, const FieldDescriptor* field, int element, std::vector<std::string>& out) {
  const auto* reflection = message.GetReflection();
  const bool  repeated   = element >= 0;

  switch (field->cpp_type()) {
    case FieldDescriptor::CPPTYPE_STRING:
      out.push_back(repeated ? reflection->GetRepeatedString(message, field, element) : reflection->GetString(message, field));
      break;
    case FieldDescriptor::CPPTYPE_INT32:
      out.push_back(std::to_string(repeated ? reflection->GetRepeatedInt32(message, field, element) : reflection->GetInt32(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_INT64:
      out.push_back(std::to_string(repeated ? reflection->GetRepeatedInt64(message, field, element) : reflection->GetInt64(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_UINT32:
      out.push_back(std::to_string(repeated ? reflection->GetRepeatedUInt32(message, field, element) : reflection->GetUInt32(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_UINT64:
      out.push_back(std::to_string(repeated ? reflection->GetRepeatedUInt64(message, field, element) : reflection->GetUInt64(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_DOUBLE:
      out.push_back(FormatNumber(repeated ? reflection->GetRepeatedDouble(message, field, element) : reflection->GetDouble(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_FLOAT:
      out.push_back(FormatNumber(repeated ? reflection->GetRepeatedFloat(message, field, element) : reflection->GetFloat(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_BOOL: {
      const bool value = repeated ? reflection->GetRepeatedBool(message, field, element) : reflection->GetBool(message, field);
      out.emplace_back(value ? "true" : "false");
      break;
    }
    case FieldDescriptor::CPPTYPE_ENUM: {
      const auto* value = repeated ? reflection->GetRepeatedEnum(message, field, element) : reflection->GetEnum(message, field);
      out.push_back(value->name());
      out.push_back(std::to_string(value->number()));
      break;
    }
    case FieldDescriptor::CPPTYPE_MESSAGE:
      break;
  }
}

void CollectValues(const Message& message, const std::vector<std::string_view>& segments, std::size_t index, std::vector<std::string>& out) {
  const auto* field = FindByJsonName(message.GetDescriptor(), segments[index]);
  if (field == nullptr) {
    return;
  }

  const auto* reflection = message.GetReflection();
  const bool  last       = index + 1 == segments.size();

  if (field->cpp_type() != FieldDescriptor::CPPTYPE_MESSAGE) {
    if (!last) return;
    if (field->is_repeated()) {
      for (int i = 0; i < reflection->FieldSize(message, field); ++i) CollectScalar(message, field, i, out);
    } else {
      CollectScalar(message, field, -1, out);
    }
    return;
  }

  auto visit = [&](const Message& child) {
    if (IsStruct(field)) {
      google::protobuf::Value as_value;
      as_value.mutable_struct_value()->CopyFrom(child);
      CollectStructValues(as_value, segments, index + 1, out);
    } else if (!last) {
      CollectValues(child, segments, index + 1, out);
    }
  };

  if (field->is_repeated()) {
    for (int i = 0; i < reflection->FieldSize(message, field); ++i) visit(reflection->GetRepeatedMessage(message, field, i));
  } else if (reflection->HasField(message, field)) {
    visit(reflection->GetMessage(message, field));
  }
}

bool LikeMatch(std::string_view value, std::string_view pattern) {
  // '%' matches any run of characters
  std::size_t v = 0, p = 0, star = std::string_view::npos, mark = 0;
  while (v < value.size()) {
    if (p < pattern.size() && pattern[p] == '%') {
      star = p++;
      mark = v;
    } else if (p < pattern.size() && pattern[p] == value[v]) {
      ++p;
      ++v;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      v = ++mark;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '%') ++p;
  return p == pattern.size();
}

std::vector<std::string> InOperands(std::string_view operand) {
  operand = Trim(operand);
  if (operand.size() >= 2 && operand.front() == '(' && operand.back() == ')') {
    operand = operand.substr(1, operand.size() - 2);
  }
  std::vector<std::string> values;
  for (auto part : Split(operand, ',')) values.emplace_back(Trim(part));
  return values;
}

} // namespace

bool IsSupportedOperator(std::string_view op) {
  return op == "=" || op == "!=" || op == "in" || op == "like";
}

std::optional<db::Criterion> ParseCriterion(std::string_view expression) {
  expression = Trim(expression);

  // "path in (...)" / "path like x": whitespace separated keyword operators
  const auto space = expression.find(' ');
  if (space != std::string_view::npos) {
    auto rest      = Trim(expression.substr(space + 1));
    auto op_end    = rest.find(' ');
    auto keyword   = Lower(rest.substr(0, op_end));
    if ((keyword == "in" || keyword == "like") && op_end != std::string_view::npos) {
      return db::Criterion{std::string(expression.substr(0, space)), keyword, std::string(Trim(rest.substr(op_end + 1)))};
    }
  }

  if (const auto pos = expression.find("!="); pos != std::string_view::npos) {
    return db::Criterion{std::string(Trim(expression.substr(0, pos))), "!=", std::string(Trim(expression.substr(pos + 2)))};
  }
  if (const auto pos = expression.find('='); pos != std::string_view::npos) {
    return db::Criterion{std::string(Trim(expression.substr(0, pos))), "=", std::string(Trim(expression.substr(pos + 1)))};
  }
  return std::nullopt;
}

std::optional<std::string> ValidatePath(const Descriptor* root, std::string_view path) {
  if (path.empty()) {
    return "empty filter path";
  }

  const auto  segments   = Split(path, '.');
  const auto* descriptor = root;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto segment = segments[i];
    if (segment.empty()) {
      return "incomplete filter path '" + std::string(path) + "'";
    }
    if (descriptor == nullptr) {
      return "filter path '" + std::string(path) + "' traverses into scalar field '" + std::string(segments[i - 1]) + "'";
    }

    const auto* field = FindByJsonName(descriptor, segment);
    if (field == nullptr) {
      return "unknown field '" + std::string(segment) + "' in filter path '" + std::string(path) + "'";
    }

    if (IsStruct(field)) {
      // free-form keys below a Struct, but at least one is required
      if (i + 1 == segments.size()) {
        return "incomplete filter path '" + std::string(path) + "'";
      }
      for (std::size_t j = i + 1; j < segments.size(); ++j) {
        if (segments[j].empty()) return "incomplete filter path '" + std::string(path) + "'";
      }
      return std::nullopt;
    }

    descriptor = field->message_type();
  }

  if (descriptor != nullptr) {
    return "incomplete filter path '" + std::string(path) + "'";
  }
  return std::nullopt;
}

bool Matches(const Message& message, const db::Criterion& criterion) {
  if (criterion.operand_left.empty()) {
    return false;
  }

  std::vector<std::string> values;
  CollectValues(message, Split(criterion.operand_left, '.'), 0, values);

  if (criterion.op == "=") {
    return std::find(values.begin(), values.end(), criterion.operand_right) != values.end();
  }
  if (criterion.op == "!=") {
    return std::find(values.begin(), values.end(), criterion.operand_right) == values.end();
  }
  if (criterion.op == "in") {
    const auto candidates = InOperands(criterion.operand_right);
    return std::any_of(values.begin(), values.end(),
                       [&](const auto& v) { return std::find(candidates.begin(), candidates.end(), v) != candidates.end(); });
  }
  if (criterion.op == "like") {
    return std::any_of(values.begin(), values.end(), [&](const auto& v) { return LikeMatch(v, criterion.operand_right); });
  }
  return false;
}

} // namespace negotiation::query
