// typecraft/types/custom_types.cpp - Built-in custom type callbacks
//
#include "typecraft/types/custom_types.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <regex>
#include <stdexcept>
#include <utility>

namespace typecraft
{

namespace
{

constexpr int64_t k_min_port = 1;
constexpr int64_t k_max_port = 65535;

/// 0000-01-01T00:00:00.000Z
constexpr int64_t k_min_epoch_ms = -62167219200000;
/// 9999-12-31T23:59:59.999Z
constexpr int64_t k_max_epoch_ms = 253402300799999;

constexpr std::string_view k_lower_alnum = "abcdefghijklmnopqrstuvwxyz0123456789";
constexpr std::string_view k_hex = "0123456789abcdef";

DecodeResult decode_fail(std::string expected, const Value & got)
{
  return DecodeResult::fail({DecodingError{Path{}, std::move(expected), got}});
}

ValidationResult validation_fail(std::string assertion, const Value & got)
{
  return ValidationResult::fail({ValidationError{Path{}, std::move(assertion), got}});
}

nlohmann::json encode_as_is(const Value & value, const EncodingOptions &, const nlohmann::json &)
{
  return value.to_json();
}

std::optional<int64_t> parse_integer(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }
  int64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::string random_string(std::mt19937_64 & engine, std::string_view alphabet, size_t length)
{
  std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out += alphabet[pick(engine)];
  }
  return out;
}

std::string random_string(std::mt19937_64 & engine, std::string_view alphabet, size_t min, size_t max)
{
  return random_string(engine, alphabet, std::uniform_int_distribution<size_t>(min, max)(engine));
}

// ============================================================================
// Port
// ============================================================================

DecodeResult decode_port(const Value & raw, const DecodingOptions & options, const nlohmann::json &)
{
  if (raw.is_number() && raw.is_integral()) {
    return DecodeResult::ok(raw);
  }
  if (raw.is_string() && options.try_casting()) {
    if (const auto parsed = parse_integer(raw.as_string())) {
      return DecodeResult::ok(Value::make_number(static_cast<double>(*parsed)));
    }
  }
  return decode_fail("TCP port number", raw);
}

ValidationResult validate_port(const Value & value, const ValidationOptions &, const nlohmann::json &)
{
  const double port = value.as_number();
  if (port < static_cast<double>(k_min_port) || port > static_cast<double>(k_max_port)) {
    return validation_fail(
      fmt::format("Invalid TCP port number (must be between {} and {})", k_min_port, k_max_port),
      value);
  }
  return ValidationResult::ok();
}

Value generate_port(std::mt19937_64 & engine, int, const nlohmann::json &)
{
  std::uniform_int_distribution<int64_t> pick(k_min_port, k_max_port);
  return Value::make_number(static_cast<double>(pick(engine)));
}

// ============================================================================
// String Formats
// ============================================================================

DecodeResult decode_string_format(
  const Value & raw, const std::string & expected, const DecodingOptions & options)
{
  if (raw.is_string()) {
    return DecodeResult::ok(raw);
  }
  if (options.try_casting() && raw.is_number()) {
    return DecodeResult::ok(Value::make_string(fmt::format("{}", raw.as_number())));
  }
  return decode_fail(expected, raw);
}

const std::regex & email_regex()
{
  static const std::regex regex(
    R"re(^[-!#$%&'*+/0-9=?A-Z^_a-z`{|}~](\.?[-!#$%&'*+/0-9=?A-Z^_a-z`{|}~])*@[a-zA-Z0-9](-*\.?[a-zA-Z0-9])*\.[a-zA-Z](-?[a-zA-Z0-9])+$)re");
  return regex;
}

const std::regex & uuid_regex()
{
  static const std::regex regex(
    "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
  return regex;
}

ValidationResult validate_email(const Value & value, const ValidationOptions &, const nlohmann::json &)
{
  const std::string & email = value.as_string();
  const auto at = email.find('@');
  if (at == std::string::npos || email.find('@', at + 1) != std::string::npos) {
    return validation_fail("Invalid email (no @ present)", value);
  }
  const std::string_view account(email.data(), at);
  const std::string_view domain(email.data() + at + 1, email.size() - at - 1);
  if (account.size() > 64) {
    return validation_fail("Invalid email (account is longer than 63 characters)", value);
  }
  if (domain.size() > 255) {
    return validation_fail("Invalid email (domain is longer than 254 characters)", value);
  }

  size_t start = 0;
  while (start <= domain.size()) {
    const size_t dot = std::min(domain.find('.', start), domain.size());
    if (dot - start > 63) {
      return validation_fail("Invalid email", value);
    }
    start = dot + 1;
  }
  if (!std::regex_match(email, email_regex())) {
    return validation_fail("Invalid email", value);
  }
  return ValidationResult::ok();
}

Value generate_email(std::mt19937_64 & engine, int, const nlohmann::json &)
{
  std::string email = random_string(engine, k_lower_alnum, 1, 10);
  email += '@';
  email += random_string(engine, k_lower_alnum, 1, 10);
  email += '.';
  email += random_string(engine, "abcdefghijklmnopqrstuvwxyz", 2, 6);
  return Value::make_string(std::move(email));
}

ValidationResult validate_uuid(const Value & value, const ValidationOptions &, const nlohmann::json &)
{
  if (!std::regex_match(value.as_string(), uuid_regex())) {
    return validation_fail("Invalid Universally Unique Identifier", value);
  }
  return ValidationResult::ok();
}

Value generate_uuid(std::mt19937_64 & engine, int, const nlohmann::json &)
{
  return Value::make_string(fmt::format(
    "{}-{}-{}-{}-{}", random_string(engine, k_hex, 8), random_string(engine, k_hex, 4),
    random_string(engine, k_hex, 4), random_string(engine, k_hex, 4),
    random_string(engine, k_hex, 12)));
}

// ============================================================================
// Datetime
// ============================================================================

constexpr std::string_view k_datetime_expected = "ISO date";

std::optional<int64_t> option_ms(const nlohmann::json & options, const char * key)
{
  const auto it = options.find(key);
  if (it == options.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<int64_t>();
}

DecodeResult decode_datetime(
  const Value & raw, const DecodingOptions & options, const nlohmann::json &)
{
  std::optional<int64_t> ms;
  if (raw.is_string()) {
    ms = parse_iso_datetime(raw.as_string());
    if (!ms && options.try_casting()) {
      ms = parse_integer(raw.as_string());
    }
  } else if (
    raw.is_number() && raw.is_integral() && options.try_casting() &&
    std::abs(raw.as_number()) <= static_cast<double>(k_max_epoch_ms)) {
    ms = static_cast<int64_t>(raw.as_number());
  }

  if (!ms || *ms < k_min_epoch_ms || *ms > k_max_epoch_ms) {
    return decode_fail(std::string(k_datetime_expected), raw);
  }
  return DecodeResult::ok(Value::make_string(format_iso_datetime(*ms)));
}

ValidationResult validate_datetime(
  const Value & value, const ValidationOptions & validation, const nlohmann::json & options)
{
  const auto ms = parse_iso_datetime(value.as_string());
  if (!ms) {
    return validation_fail("Invalid datetime", value);
  }

  ValidationErrors errors;
  if (const auto maximum = option_ms(options, "maximum_ms"); maximum && *ms > *maximum) {
    errors.push_back(
      {Path{}, fmt::format("Datetime must be maximum {}", format_iso_datetime(*maximum)), value});
    if (validation.stop_at_first_error()) {
      return ValidationResult::fail(std::move(errors));
    }
  }
  if (const auto minimum = option_ms(options, "minimum_ms"); minimum && *ms < *minimum) {
    errors.push_back(
      {Path{}, fmt::format("Datetime must be minimum {}", format_iso_datetime(*minimum)), value});
  }
  if (!errors.empty()) {
    return ValidationResult::fail(std::move(errors));
  }
  return ValidationResult::ok();
}

Value generate_datetime(std::mt19937_64 & engine, int, const nlohmann::json & options)
{
  std::uniform_int_distribution<int64_t> pick(
    option_ms(options, "minimum_ms").value_or(0),
    option_ms(options, "maximum_ms").value_or(k_max_epoch_ms));
  return Value::make_string(format_iso_datetime(pick(engine)));
}

/// Consume exactly `count` digits
std::optional<int> take_digits(std::string_view text, size_t & pos, size_t count)
{
  if (pos + count > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  pos += count;
  return value;
}

bool take_char(std::string_view text, size_t & pos, char expected)
{
  if (pos < text.size() && text[pos] == expected) {
    ++pos;
    return true;
  }
  return false;
}

// ============================================================================
// JSON
// ============================================================================

DecodeResult decode_json(const Value & raw, const DecodingOptions &, const nlohmann::json &)
{
  if (raw.is_undefined()) {
    return DecodeResult::ok(Value::make_null());
  }
  return DecodeResult::ok(Value::from_json(raw.to_json()));
}

ValidationResult validate_json(const Value & value, const ValidationOptions &, const nlohmann::json & options)
{
  const auto it = options.find("size_limit");
  if (it == options.end() || !it->is_number_unsigned()) {
    return ValidationResult::ok();
  }
  const auto limit = it->get<size_t>();
  const size_t size = value.to_json().dump().size();
  if (size > limit) {
    return validation_fail(
      fmt::format("json must be maximum of {}B", limit),
      Value::make_number(static_cast<double>(size)));
  }
  return ValidationResult::ok();
}

Value random_json(std::mt19937_64 & engine, int depth)
{
  const int last = depth > 0 ? 5 : 3;
  switch (std::uniform_int_distribution<int>(0, last)(engine)) {
    case 0:
      return Value::make_null();
    case 1:
      return Value::make_bool(std::bernoulli_distribution(0.5)(engine));
    case 2:
      return Value::make_number(
        static_cast<double>(std::uniform_int_distribution<int>(-1000, 1000)(engine)));
    case 3:
      return Value::make_string(random_string(engine, k_lower_alnum, 0, 8));
    case 4: {
      Value::Array items;
      const size_t count = std::uniform_int_distribution<size_t>(0, 3)(engine);
      for (size_t i = 0; i < count; ++i) {
        items.push_back(random_json(engine, depth - 1));
      }
      return Value::make_array(std::move(items));
    }
    default: {
      Value out = Value::make_object();
      const size_t count = std::uniform_int_distribution<size_t>(0, 3)(engine);
      for (size_t i = 0; i < count; ++i) {
        out.set(random_string(engine, k_lower_alnum, 1, 6), random_json(engine, depth - 1));
      }
      return out;
    }
  }
}

Value generate_json(std::mt19937_64 & engine, int depth, const nlohmann::json &)
{
  return random_json(engine, depth);
}

// ============================================================================
// Never
// ============================================================================

DecodeResult decode_never(const Value & raw, const DecodingOptions &, const nlohmann::json &)
{
  return decode_fail("never", raw);
}

nlohmann::json encode_never(const Value &, const EncodingOptions &, const nlohmann::json &)
{
  throw std::logic_error("tried encoding a never value");
}

ValidationResult validate_never(const Value & value, const ValidationOptions &, const nlohmann::json &)
{
  return validation_fail("never value", value);
}

Value generate_never(std::mt19937_64 &, int, const nlohmann::json &)
{
  throw std::logic_error("tried generating a never value");
}

}  // namespace

// ============================================================================
// Factories
// ============================================================================

const Type * port_type(TypeContext & ctx, TypeOptions options)
{
  CustomCodec codec{decode_port, encode_as_is, validate_port, generate_port};
  return ctx.custom_type("port", std::move(codec), nlohmann::json::object(), std::move(options));
}

const Type * email_type(TypeContext & ctx, TypeOptions options)
{
  CustomCodec codec{
    [](const Value & raw, const DecodingOptions & decoding, const nlohmann::json &) {
      return decode_string_format(raw, "email", decoding);
    },
    encode_as_is, validate_email, generate_email};
  return ctx.custom_type("email", std::move(codec), nlohmann::json::object(), std::move(options));
}

const Type * uuid_type(TypeContext & ctx, TypeOptions options)
{
  CustomCodec codec{
    [](const Value & raw, const DecodingOptions & decoding, const nlohmann::json &) {
      return decode_string_format(raw, "UUID", decoding);
    },
    encode_as_is, validate_uuid, generate_uuid};
  return ctx.custom_type("UUID", std::move(codec), nlohmann::json::object(), std::move(options));
}

const Type * datetime_type(TypeContext & ctx, DateTimeOptions datetime_options, TypeOptions options)
{
  nlohmann::json custom_options = nlohmann::json::object();
  std::optional<int64_t> minimum;
  std::optional<int64_t> maximum;
  if (datetime_options.minimum) {
    minimum = parse_iso_datetime(*datetime_options.minimum);
    if (!minimum) {
      throw std::invalid_argument(
        fmt::format("invalid datetime minimum '{}'", *datetime_options.minimum));
    }
    custom_options["minimum_ms"] = *minimum;
  }
  if (datetime_options.maximum) {
    maximum = parse_iso_datetime(*datetime_options.maximum);
    if (!maximum) {
      throw std::invalid_argument(
        fmt::format("invalid datetime maximum '{}'", *datetime_options.maximum));
    }
    custom_options["maximum_ms"] = *maximum;
  }
  if (minimum && maximum && *minimum > *maximum) {
    throw std::invalid_argument("datetime minimum is after maximum");
  }

  CustomCodec codec{decode_datetime, encode_as_is, validate_datetime, generate_datetime};
  return ctx.custom_type("datetime", std::move(codec), std::move(custom_options), std::move(options));
}

const Type * json_type(TypeContext & ctx, JsonOptions json_options, TypeOptions options)
{
  nlohmann::json custom_options = nlohmann::json::object();
  if (json_options.size_limit) {
    custom_options["size_limit"] = *json_options.size_limit;
  }
  CustomCodec codec{decode_json, encode_as_is, validate_json, generate_json};
  return ctx.custom_type("json", std::move(codec), std::move(custom_options), std::move(options));
}

const Type * never_type(TypeContext & ctx, TypeOptions options)
{
  CustomCodec codec{decode_never, encode_never, validate_never, generate_never};
  return ctx.custom_type("never", std::move(codec), nlohmann::json::object(), std::move(options));
}

// ============================================================================
// Datetime Helpers
// ============================================================================

std::optional<int64_t> parse_iso_datetime(std::string_view text)
{
  using namespace std::chrono;

  size_t pos = 0;
  const auto y = take_digits(text, pos, 4);
  if (!y || !take_char(text, pos, '-')) {
    return std::nullopt;
  }
  const auto mo = take_digits(text, pos, 2);
  if (!mo || !take_char(text, pos, '-')) {
    return std::nullopt;
  }
  const auto d = take_digits(text, pos, 2);
  if (!d) {
    return std::nullopt;
  }
  const year_month_day date{
    year{*y}, month{static_cast<unsigned>(*mo)}, day{static_cast<unsigned>(*d)}};
  if (!date.ok()) {
    return std::nullopt;
  }

  int64_t ms_of_day = 0;
  int64_t offset_minutes = 0;
  if (pos < text.size()) {
    if (!take_char(text, pos, 'T') && !take_char(text, pos, ' ')) {
      return std::nullopt;
    }
    const auto h = take_digits(text, pos, 2);
    if (!h || !take_char(text, pos, ':')) {
      return std::nullopt;
    }
    const auto mi = take_digits(text, pos, 2);
    if (!mi) {
      return std::nullopt;
    }
    int s = 0;
    int ms = 0;
    if (take_char(text, pos, ':')) {
      const auto sec = take_digits(text, pos, 2);
      if (!sec) {
        return std::nullopt;
      }
      s = *sec;
      if (take_char(text, pos, '.')) {
        // Milliseconds precision, further digits are truncated
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
          if (digits < 3) {
            ms = ms * 10 + (text[pos] - '0');
          }
          ++digits;
          ++pos;
        }
        if (digits == 0) {
          return std::nullopt;
        }
        for (; digits < 3; ++digits) {
          ms *= 10;
        }
      }
    }
    if (*h > 23 || *mi > 59 || s > 59) {
      return std::nullopt;
    }
    ms_of_day = ((int64_t{*h} * 60 + *mi) * 60 + s) * 1000 + ms;

    if (pos < text.size() && !take_char(text, pos, 'Z')) {
      const char sign = text[pos];
      if (sign != '+' && sign != '-') {
        return std::nullopt;
      }
      ++pos;
      const auto oh = take_digits(text, pos, 2);
      take_char(text, pos, ':');
      const auto om = take_digits(text, pos, 2);
      if (!oh || !om || *oh > 23 || *om > 59) {
        return std::nullopt;
      }
      offset_minutes = (sign == '+' ? 1 : -1) * (int64_t{*oh} * 60 + *om);
    }
    if (pos != text.size()) {
      return std::nullopt;
    }
  }

  const int64_t day_ms = duration_cast<milliseconds>(sys_days{date}.time_since_epoch()).count();
  return day_ms + ms_of_day - offset_minutes * 60000;
}

std::string format_iso_datetime(int64_t epoch_ms)
{
  using namespace std::chrono;

  if (epoch_ms < k_min_epoch_ms || epoch_ms > k_max_epoch_ms) {
    throw std::invalid_argument(fmt::format("datetime {}ms is out of range", epoch_ms));
  }
  const sys_time<milliseconds> tp{milliseconds{epoch_ms}};
  const auto day_point = floor<days>(tp);
  const year_month_day date{day_point};
  const hh_mm_ss<milliseconds> time{tp - day_point};
  return fmt::format(
    "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", static_cast<int>(date.year()),
    static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()), time.hours().count(),
    time.minutes().count(), time.seconds().count(), time.subseconds().count());
}

}  // namespace typecraft
