// typecraft/codec/options.hpp - Per-operation policies
//
// Options are passed by value through the recursive traversals.
//
#pragma once

namespace typecraft
{

enum class TypeCastingStrategy {
  ExpectExactTypes,
  TryCasting,
};

enum class ErrorReportingStrategy {
  StopAtFirstError,
  AllErrors,
};

enum class FieldStrictness {
  ExpectExactFields,
  AllowAdditionalFields,
};

enum class SensitiveInformationStrategy {
  ContinueWithSensitiveInformation,
  Hide,
};

struct DecodingOptions
{
  TypeCastingStrategy type_casting = TypeCastingStrategy::ExpectExactTypes;
  ErrorReportingStrategy error_reporting = ErrorReportingStrategy::StopAtFirstError;
  FieldStrictness field_strictness = FieldStrictness::ExpectExactFields;

  [[nodiscard]] bool try_casting() const noexcept
  {
    return type_casting == TypeCastingStrategy::TryCasting;
  }

  [[nodiscard]] bool stop_at_first_error() const noexcept
  {
    return error_reporting == ErrorReportingStrategy::StopAtFirstError;
  }

  [[nodiscard]] bool allow_additional_fields() const noexcept
  {
    return field_strictness == FieldStrictness::AllowAdditionalFields;
  }
};

struct ValidationOptions
{
  ErrorReportingStrategy error_reporting = ErrorReportingStrategy::StopAtFirstError;

  [[nodiscard]] bool stop_at_first_error() const noexcept
  {
    return error_reporting == ErrorReportingStrategy::StopAtFirstError;
  }
};

struct EncodingOptions
{
  SensitiveInformationStrategy sensitive_information =
    SensitiveInformationStrategy::ContinueWithSensitiveInformation;

  [[nodiscard]] bool hide_sensitive() const noexcept
  {
    return sensitive_information == SensitiveInformationStrategy::Hide;
  }
};

}  // namespace typecraft
