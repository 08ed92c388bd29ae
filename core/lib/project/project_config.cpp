// typecraft/project/project_config.cpp - Project configuration implementation
//
#include "typecraft/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fmt/core.h>

#include <initializer_list>
#include <utility>

namespace typecraft
{

namespace
{

template <typename EnumT>
struct Enumerator
{
  const char * name;
  EnumT value;
};

/// Parse `section.key` as one of `choices`; absent keys keep `out`
template <typename EnumT>
bool parse_enum(
  const YAML::Node & section, const char * section_name, const char * key,
  std::initializer_list<Enumerator<EnumT>> choices, EnumT & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  const auto text = node.as<std::string>();
  for (const auto & choice : choices) {
    if (text == choice.name) {
      out = choice.value;
      return true;
    }
  }

  std::string expected;
  for (const auto & choice : choices) {
    expected += expected.empty() ? "" : ", ";
    expected += fmt::format("'{}'", choice.name);
  }
  error = fmt::format("invalid {}.{}: '{}' (must be one of {})", section_name, key, text, expected);
  return false;
}

/// Fetch a section, failing when present but not a map
bool get_section(const YAML::Node & root, const char * name, YAML::Node & out, std::string & error)
{
  out = root[name];
  if (out && !out.IsMap()) {
    error = fmt::format("{} must be a map", name);
    return false;
  }
  return true;
}

bool parse_error_reporting(
  const YAML::Node & section, const char * section_name, ErrorReportingStrategy & out,
  std::string & error)
{
  return parse_enum<ErrorReportingStrategy>(
    section, section_name, "error_reporting",
    {{"stop_at_first_error", ErrorReportingStrategy::StopAtFirstError},
     {"all_errors", ErrorReportingStrategy::AllErrors}},
    out, error);
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  if (root.IsNull()) {
    return ConfigLoadResult::ok(ProjectConfig{});
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  ProjectConfig config;
  std::string error;
  YAML::Node section;

  // Parse 'decoding' section
  if (!get_section(root, "decoding", section, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (section) {
    const bool ok =
      parse_enum<TypeCastingStrategy>(
        section, "decoding", "type_casting",
        {{"expect_exact_types", TypeCastingStrategy::ExpectExactTypes},
         {"try_casting", TypeCastingStrategy::TryCasting}},
        config.decoding.type_casting, error) &&
      parse_error_reporting(section, "decoding", config.decoding.error_reporting, error) &&
      parse_enum<FieldStrictness>(
        section, "decoding", "field_strictness",
        {{"expect_exact_fields", FieldStrictness::ExpectExactFields},
         {"allow_additional_fields", FieldStrictness::AllowAdditionalFields}},
        config.decoding.field_strictness, error);
    if (!ok) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'validation' section
  if (!get_section(root, "validation", section, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (section &&
      !parse_error_reporting(section, "validation", config.validation.error_reporting, error)) {
    return ConfigLoadResult::fail(error);
  }

  // Parse 'encoding' section
  if (!get_section(root, "encoding", section, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (section &&
      !parse_enum<SensitiveInformationStrategy>(
        section, "encoding", "sensitive_information",
        {{"continue", SensitiveInformationStrategy::ContinueWithSensitiveInformation},
         {"hide", SensitiveInformationStrategy::Hide}},
        config.encoding.sensitive_information, error)) {
    return ConfigLoadResult::fail(error);
  }

  // Parse 'arbitrary' section
  if (!get_section(root, "arbitrary", section, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (section) {
    if (section["seed"]) {
      config.arbitrary.seed = section["seed"].as<uint64_t>();
    }
    if (section["max_depth"]) {
      config.arbitrary.max_depth = section["max_depth"].as<int>();
      if (config.arbitrary.max_depth < 0) {
        return ConfigLoadResult::fail("arbitrary.max_depth must not be negative");
      }
    }
  }

  // Parse 'retrieve' section
  if (!get_section(root, "retrieve", section, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (section) {
    if (section["max_take"]) {
      config.retrieve.max_take = section["max_take"].as<size_t>();
    }
    if (section["max_selection_depth"]) {
      config.retrieve.max_selection_depth = section["max_selection_depth"].as<int>();
      if (config.retrieve.max_selection_depth < 1) {
        return ConfigLoadResult::fail("retrieve.max_selection_depth must be at least 1");
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult parse_guarded(const YAML::Node & root)
{
  try {
    return parse_root(root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result = parse_guarded(root);
  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult parse_project_config(std::string_view yaml)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_guarded(root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // A file starts the search from its directory
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace typecraft
