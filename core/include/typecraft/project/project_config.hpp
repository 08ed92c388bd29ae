// typecraft/project/project_config.hpp - Project configuration (typecraft.yaml)
//
// Parses and validates typecraft.yaml: the default options of the
// codecs, the arbitrary generator and the retrieve deriver.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "typecraft/codec/options.hpp"
#include "typecraft/retrieve/retrieve.hpp"

namespace typecraft
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Arbitrary generation section.
 */
struct ArbitraryConfig
{
  uint64_t seed = 0;
  int max_depth = 3;
};

/**
 * Retrieve section.
 */
struct RetrieveConfig
{
  /// Upper bound of `take` in derived retrieve types
  size_t max_take = 20;

  /// Deepest selection a caller may request through relations
  int max_selection_depth = 4;

  /// Capabilities granting every retrieve field, bounded by max_take
  [[nodiscard]] Capabilities capabilities() const { return Capabilities::all(max_take); }

  /// Check a retrieve value against max_selection_depth
  [[nodiscard]] bool allows(const Type * type, const Value & retrieve) const
  {
    return selection_depth(type, retrieve) <= max_selection_depth;
  }
};

/**
 * Complete project configuration (typecraft.yaml).
 */
struct ProjectConfig
{
  DecodingOptions decoding;
  ValidationOptions validation;
  EncodingOptions encoding;
  ArbitraryConfig arbitrary;
  RetrieveConfig retrieve;

  /// Directory containing typecraft.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a typecraft.yaml file.
 *
 * Missing sections and keys keep their defaults. Unknown enumerators,
 * out of range numbers and sections that are not maps fail loading.
 *
 * @param config_path Path to typecraft.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Load a configuration from YAML text (project_root is left empty)
[[nodiscard]] ConfigLoadResult parse_project_config(std::string_view yaml);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to typecraft.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "typecraft.yaml";

}  // namespace typecraft
