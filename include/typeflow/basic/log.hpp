// typeflow/basic/log.hpp - Logging macros built on spdlog
//
// The analysis logs phase boundaries and statistics at debug level and
// malformed input at error level. Sinks and levels are owned by the
// embedding application; Analyzer only applies AnalysisOptions::log_level.
//
#pragma once

#include <spdlog/spdlog.h>

#define TYPEFLOW_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define TYPEFLOW_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define TYPEFLOW_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define TYPEFLOW_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define TYPEFLOW_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
