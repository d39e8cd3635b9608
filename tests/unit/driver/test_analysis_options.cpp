#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "typeflow/driver/analysis_options.hpp"

using namespace typeflow;

namespace fs = std::filesystem;

// ============================================================================
// Parsing
// ============================================================================

TEST(DriverAnalysisOptions, DefaultsForEmptyDocument)
{
  auto r = parse_analysis_config("");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.options.preserve_baseline_edges);
  EXPECT_EQ(r.options.build_threads, 1U);
  EXPECT_EQ(r.options.round_limit, 0U);
  EXPECT_EQ(r.options.log_level, "warn");
}

TEST(DriverAnalysisOptions, ParsesAllKeys)
{
  auto r = parse_analysis_config(
    "analysis:\n"
    "  preserve_baseline_edges: false\n"
    "  build_threads: 4\n"
    "  round_limit: 100\n"
    "logging:\n"
    "  level: debug\n");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_FALSE(r.options.preserve_baseline_edges);
  EXPECT_EQ(r.options.build_threads, 4U);
  EXPECT_EQ(r.options.round_limit, 100U);
  EXPECT_EQ(r.options.log_level, "debug");
}

TEST(DriverAnalysisOptions, RejectsInvalidValues)
{
  auto zero_threads = parse_analysis_config("analysis:\n  build_threads: 0\n");
  EXPECT_FALSE(zero_threads.success);
  EXPECT_NE(zero_threads.error.find("build_threads"), std::string::npos);
  EXPECT_EQ(zero_threads.error.rfind(k_diag_config_error, 0), 0U);

  auto negative = parse_analysis_config("analysis:\n  round_limit: -1\n");
  EXPECT_FALSE(negative.success);
  EXPECT_NE(negative.error.find("round_limit"), std::string::npos);

  auto level = parse_analysis_config("logging:\n  level: loud\n");
  EXPECT_FALSE(level.success);
  EXPECT_NE(level.error.find("loud"), std::string::npos);

  auto not_bool = parse_analysis_config("analysis:\n  preserve_baseline_edges: maybe\n");
  EXPECT_FALSE(not_bool.success);

  auto not_map = parse_analysis_config("analysis: [1, 2]\n");
  EXPECT_FALSE(not_map.success);

  auto broken = parse_analysis_config("analysis: {build_threads: 2\n");
  EXPECT_FALSE(broken.success);
}

TEST(DriverAnalysisOptions, LogLevelNames)
{
  EXPECT_TRUE(is_valid_log_level("trace"));
  EXPECT_TRUE(is_valid_log_level("off"));
  EXPECT_FALSE(is_valid_log_level("warning"));
  EXPECT_FALSE(is_valid_log_level(""));
}

// ============================================================================
// Files
// ============================================================================

TEST(DriverAnalysisOptions, LoadAndFindConfigFile)
{
  const fs::path root = fs::temp_directory_path() / "typeflow_options_test";
  const fs::path nested = root / "a" / "b";
  fs::remove_all(root);
  fs::create_directories(nested);

  {
    std::ofstream out(root / k_analysis_config_file_name);
    out << "analysis:\n  build_threads: 2\n";
  }

  auto found = find_analysis_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(root / k_analysis_config_file_name));

  auto r = load_analysis_config(*found);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.options.build_threads, 2U);

  auto missing = load_analysis_config(root / "missing.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("not found"), std::string::npos);

  fs::remove_all(root);
}
