// typeflow/driver/analysis_options.hpp - Analysis options (typeflow.yaml)
//
// Options for Analyzer and their YAML representation:
//
// ```yaml
// analysis:
//   preserve_baseline_edges: true
//   build_threads: 4
//   round_limit: 0
// logging:
//   level: warn
// ```
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace typeflow
{

// ============================================================================
// Options
// ============================================================================

struct AnalysisOptions
{
  /// Seed the resulting call graph with the baseline graph
  bool preserve_baseline_edges = true;

  /// Worker threads for flow graph construction
  size_t build_threads = 1;

  /// Explicit propagation round bound; 0 selects node count + 1
  size_t round_limit = 0;

  /// spdlog level name: trace, debug, info, warn, error, critical, off
  std::string log_level = "warn";
};

/// True if `name` is a level name accepted in `logging.level`
[[nodiscard]] bool is_valid_log_level(std::string_view name);

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading an analysis configuration.
 */
struct ConfigLoadResult
{
  /// Loaded options (only valid if success == true)
  AnalysisOptions options;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(AnalysisOptions opts)
  {
    ConfigLoadResult r;
    r.options = std::move(opts);
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

/// Code prefixed to configuration errors
inline constexpr const char * k_diag_config_error = "CFG001";

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Parse analysis options from YAML text.
 *
 * Missing keys keep their defaults. Out-of-range values fail with a message.
 */
[[nodiscard]] ConfigLoadResult parse_analysis_config(std::string_view text);

/**
 * Load analysis options from a typeflow.yaml file.
 *
 * @param config_path Path to typeflow.yaml
 * @return ConfigLoadResult with the loaded options or error message
 */
[[nodiscard]] ConfigLoadResult load_analysis_config(const std::filesystem::path & config_path);

/**
 * Find typeflow.yaml by searching upward from `start_dir`.
 *
 * @return Path to typeflow.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_analysis_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_analysis_config_file_name = "typeflow.yaml";

}  // namespace typeflow
