// typecraft/basic/value.cpp - Value implementation
#include "typecraft/basic/value.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>

namespace typecraft
{

Value Value::from_json(const nlohmann::json & json)
{
  switch (json.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
      return make_null();
    case nlohmann::json::value_t::boolean:
      return make_bool(json.get<bool>());
    case nlohmann::json::value_t::number_integer:
      return make_number(static_cast<double>(json.get<int64_t>()));
    case nlohmann::json::value_t::number_unsigned:
      return make_number(static_cast<double>(json.get<uint64_t>()));
    case nlohmann::json::value_t::number_float:
      return make_number(json.get<double>());
    case nlohmann::json::value_t::string:
      return make_string(json.get<std::string>());
    case nlohmann::json::value_t::array: {
      Array items;
      items.reserve(json.size());
      for (const auto & item : json) {
        items.push_back(from_json(item));
      }
      return make_array(std::move(items));
    }
    case nlohmann::json::value_t::object: {
      Object fields;
      fields.reserve(json.size());
      for (const auto & [key, item] : json.items()) {
        fields.emplace_back(key, from_json(item));
      }
      return make_object(std::move(fields));
    }
    case nlohmann::json::value_t::binary:
      break;
  }
  return make_null();
}

bool Value::is_integral() const noexcept
{
  return kind_ == ValueKind::Number && std::isfinite(number_) && std::trunc(number_) == number_;
}

size_t Value::size() const noexcept
{
  if (kind_ == ValueKind::Array) {
    return items_.size();
  }
  if (kind_ == ValueKind::Object) {
    return static_cast<size_t>(std::count_if(fields_.begin(), fields_.end(), [](const Field & f) {
      return !f.second.is_undefined();
    }));
  }
  return 0;
}

const Value * Value::find(std::string_view key) const noexcept
{
  for (const auto & [name, value] : fields_) {
    if (name == key) {
      return value.is_undefined() ? nullptr : &value;
    }
  }
  return nullptr;
}

Value Value::get(std::string_view key) const
{
  const Value * v = find(key);
  return v != nullptr ? *v : Value{};
}

void Value::set(std::string key, Value value)
{
  for (auto & [name, existing] : fields_) {
    if (name == key) {
      existing = std::move(value);
      return;
    }
  }
  fields_.emplace_back(std::move(key), std::move(value));
}

void Value::erase(std::string_view key)
{
  fields_.erase(
    std::remove_if(
      fields_.begin(), fields_.end(), [key](const Field & f) { return f.first == key; }),
    fields_.end());
}

void Value::push_back(Value value) { items_.push_back(std::move(value)); }

nlohmann::json Value::to_json() const
{
  switch (kind_) {
    case ValueKind::Undefined:
    case ValueKind::Null:
      return nullptr;
    case ValueKind::Boolean:
      return bool_;
    case ValueKind::Number:
      // Keep integral numbers integral on the wire
      if (is_integral() && std::fabs(number_) <= 9007199254740992.0) {
        return static_cast<int64_t>(number_);
      }
      return number_;
    case ValueKind::String:
      return string_;
    case ValueKind::Array: {
      nlohmann::json out = nlohmann::json::array();
      for (const auto & item : items_) {
        out.push_back(item.to_json());
      }
      return out;
    }
    case ValueKind::Object: {
      nlohmann::json out = nlohmann::json::object();
      for (const auto & [name, value] : fields_) {
        if (!value.is_undefined()) {
          out[name] = value.to_json();
        }
      }
      return out;
    }
  }
  return nullptr;
}

std::string Value::to_string() const
{
  if (kind_ == ValueKind::Undefined) {
    return "undefined";
  }
  return to_json().dump();
}

bool operator==(const Value & lhs, const Value & rhs)
{
  if (lhs.kind_ != rhs.kind_) {
    return false;
  }
  switch (lhs.kind_) {
    case ValueKind::Undefined:
    case ValueKind::Null:
      return true;
    case ValueKind::Boolean:
      return lhs.bool_ == rhs.bool_;
    case ValueKind::Number:
      return lhs.number_ == rhs.number_;
    case ValueKind::String:
      return lhs.string_ == rhs.string_;
    case ValueKind::Array:
      return lhs.items_ == rhs.items_;
    case ValueKind::Object: {
      // Field order does not matter
      if (lhs.size() != rhs.size()) {
        return false;
      }
      for (const auto & [name, value] : lhs.fields_) {
        if (value.is_undefined()) {
          continue;
        }
        const Value * other = rhs.find(name);
        if (other == nullptr || !(*other == value)) {
          return false;
        }
      }
      return true;
    }
  }
  return false;
}

void PrintTo(const Value & value, std::ostream * os) { *os << value.to_string(); }

}  // namespace typecraft
