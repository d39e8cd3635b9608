// typeflow/driver/analysis_options.cpp - Analysis options loading
//
#include "typeflow/driver/analysis_options.hpp"

#include <array>

#include <yaml-cpp/yaml.h>

namespace typeflow
{

namespace
{

constexpr std::array<std::string_view, 7> k_log_levels = {
  "trace", "debug", "info", "warn", "error", "critical", "off"};

ConfigLoadResult config_error(const std::string & msg)
{
  return ConfigLoadResult::fail(std::string(k_diag_config_error) + ": " + msg);
}

/// Signed read, so that negative values are rejected instead of wrapping
std::optional<long long> read_integer(const YAML::Node & node)
{
  try {
    return node.as<long long>();
  } catch (const YAML::Exception &) {
    return std::nullopt;
  }
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  AnalysisOptions options;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(options);
  }
  if (!root.IsMap()) {
    return config_error("configuration root must be a map");
  }

  // Parse 'analysis' section
  if (const auto analysis = root["analysis"]) {
    if (!analysis.IsMap()) {
      return config_error("analysis must be a map");
    }

    if (analysis["preserve_baseline_edges"]) {
      try {
        options.preserve_baseline_edges = analysis["preserve_baseline_edges"].as<bool>();
      } catch (const YAML::Exception &) {
        return config_error("analysis.preserve_baseline_edges must be a boolean");
      }
    }

    if (analysis["build_threads"]) {
      auto v = read_integer(analysis["build_threads"]);
      if (!v) {
        return config_error("analysis.build_threads must be an integer");
      }
      if (*v < 1) {
        return config_error(
          "invalid analysis.build_threads: " + std::to_string(*v) + " (must be at least 1)");
      }
      options.build_threads = static_cast<size_t>(*v);
    }

    if (analysis["round_limit"]) {
      auto v = read_integer(analysis["round_limit"]);
      if (!v) {
        return config_error("analysis.round_limit must be an integer");
      }
      if (*v < 0) {
        return config_error(
          "invalid analysis.round_limit: " + std::to_string(*v) + " (must not be negative)");
      }
      options.round_limit = static_cast<size_t>(*v);
    }
  }

  // Parse 'logging' section
  if (const auto logging = root["logging"]) {
    if (!logging.IsMap()) {
      return config_error("logging must be a map");
    }
    if (logging["level"]) {
      try {
        options.log_level = logging["level"].as<std::string>();
      } catch (const YAML::Exception &) {
        return config_error("logging.level must be a string");
      }
      if (!is_valid_log_level(options.log_level)) {
        return config_error(
          "invalid logging.level: '" + options.log_level +
          "' (must be one of trace, debug, info, warn, error, critical, off)");
      }
    }
  }

  return ConfigLoadResult::ok(std::move(options));
}

}  // namespace

bool is_valid_log_level(std::string_view name)
{
  for (auto level : k_log_levels) {
    if (level == name) {
      return true;
    }
  }
  return false;
}

ConfigLoadResult parse_analysis_config(std::string_view text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception & e) {
    return config_error("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

ConfigLoadResult load_analysis_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return config_error("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return config_error("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

std::optional<std::filesystem::path> find_analysis_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_analysis_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace typeflow
