#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <spdlog/common.h>
#include <langextract/core/types.h>
#include <langextract/engine/extraction_engine.h>
#include <langextract/engine/provider_gateway.h>

namespace langextract::config {

/**
 * @brief Everything needed to stand up an engine and its gateway.
 *
 * Recognized sections and keys:
 *   [engine]    max_concurrent_requests, default_timeout_ms, default_retry_count,
 *               enable_multi_pass, max_passes, pass_improvement_threshold,
 *               enable_deduplication, overlap_strategy, confidence_threshold,
 *               enable_progress_tracking, progress_interval_ms, log_level
 *   [alignment] case_sensitive, ignore_whitespace, ignore_punctuation, max_distance,
 *               min_confidence, max_candidates, window_size, timeout_ms
 *   [gateway]   unhealthy_threshold, recovery_threshold, initial_backoff_ms,
 *               backoff_multiplier, max_backoff_ms, enable_caching, cache_max_entries,
 *               cache_ttl_ms
 */
struct EngineConfig {
    engine::EngineOptions engine;
    engine::GatewayConfig gateway;
    spdlog::level::level_enum logLevel = spdlog::level::warn;
    std::filesystem::path source; ///< File the values came from; empty for defaults
};

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name);

/// Parse @p path; unknown keys are logged and ignored, malformed values are InvalidData
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path);

/**
 * @brief Resolve and load the active configuration.
 *
 * The file is @p overridePath, else $LANGEXTRACT_CONFIG, else the per-user config path.
 * A missing default file yields defaults; a missing explicit file is NotFound.
 * $LANGEXTRACT_LOG_LEVEL overrides the file's log level.
 */
Result<EngineConfig> resolveEngineConfig(const std::string& overridePath = "");

} // namespace langextract::config
