#include <langextract/config/config_helpers.h>
#include <langextract/config/engine_config.h>
#include <langextract/core/format.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <functional>
#include <map>
#include <system_error>

namespace langextract::config {

namespace {

using Values = std::map<std::string, std::string>;
using Setter = std::function<Result<void>(const std::string&)>;

template <typename T> Result<T> parseNumber(const std::string& key, const std::string& value) {
    T out{};
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::InvalidData, format("{}: expected a number, got '{}'", key, value)};
    }
    return out;
}

Setter intSetter(const std::string& key, int& target) {
    return [key, &target](const std::string& value) -> Result<void> {
        auto parsed = parseNumber<int>(key, value);
        if (!parsed) {
            return parsed.error();
        }
        target = parsed.value();
        return {};
    };
}

Setter sizeSetter(const std::string& key, std::size_t& target) {
    return [key, &target](const std::string& value) -> Result<void> {
        auto parsed = parseNumber<std::size_t>(key, value);
        if (!parsed) {
            return parsed.error();
        }
        target = parsed.value();
        return {};
    };
}

Setter doubleSetter(const std::string& key, double& target) {
    return [key, &target](const std::string& value) -> Result<void> {
        auto parsed = parseNumber<double>(key, value);
        if (!parsed) {
            return parsed.error();
        }
        target = parsed.value();
        return {};
    };
}

Setter msSetter(const std::string& key, std::chrono::milliseconds& target) {
    return [key, &target](const std::string& value) -> Result<void> {
        auto parsed = parseNumber<long long>(key, value);
        if (!parsed) {
            return parsed.error();
        }
        target = std::chrono::milliseconds(parsed.value());
        return {};
    };
}

Setter boolSetter(const std::string& key, bool& target) {
    return [key, &target](const std::string& value) -> Result<void> {
        auto parsed = parse_bool(value);
        if (!parsed) {
            return Error{ErrorCode::InvalidData,
                         format("{}: expected a boolean, got '{}'", key, value)};
        }
        target = *parsed;
        return {};
    };
}

Result<void> applySection(const std::string& section, const Values& values,
                          const std::map<std::string, Setter>& setters) {
    for (const auto& [key, value] : values) {
        auto it = setters.find(key);
        if (it == setters.end()) {
            spdlog::warn("config: ignoring unknown key '{}.{}'", section, key);
            continue;
        }
        if (auto applied = it->second(value); !applied) {
            return Error{applied.error().code,
                         format("[{}] {}", section, applied.error().message)};
        }
    }
    return {};
}

} // namespace

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
    std::string v(name);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "warning") {
        return spdlog::level::warn;
    }
    if (v == "error") {
        return spdlog::level::err;
    }
    auto level = spdlog::level::from_str(v);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && v != "off") {
        return std::nullopt;
    }
    return level;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::NotFound, format("config file not found: {}", path.string())};
    }

    EngineConfig cfg;
    cfg.source = path;
    auto& eng = cfg.engine;
    auto& aln = eng.alignment;
    auto& gw = cfg.gateway;

    const std::map<std::string, Setter> engineKeys = {
        {"max_concurrent_requests",
         intSetter("max_concurrent_requests", eng.maxConcurrentRequests)},
        {"default_timeout_ms", msSetter("default_timeout_ms", eng.defaultTimeout)},
        {"default_retry_count", intSetter("default_retry_count", eng.defaultRetryCount)},
        {"enable_multi_pass", boolSetter("enable_multi_pass", eng.enableMultiPass)},
        {"max_passes", intSetter("max_passes", eng.maxPasses)},
        {"pass_improvement_threshold",
         doubleSetter("pass_improvement_threshold", eng.passImprovementThreshold)},
        {"enable_deduplication",
         boolSetter("enable_deduplication", eng.aggregation.enableDeduplication)},
        {"overlap_strategy",
         [&eng](const std::string& value) -> Result<void> {
             auto strategy = engine::parseOverlapStrategy(value);
             if (!strategy) {
                 return Error{ErrorCode::InvalidData,
                              format("overlap_strategy: unknown strategy '{}'", value)};
             }
             eng.aggregation.overlapStrategy = *strategy;
             return {};
         }},
        {"confidence_threshold",
         doubleSetter("confidence_threshold", eng.aggregation.confidenceThreshold)},
        {"enable_progress_tracking",
         boolSetter("enable_progress_tracking", eng.enableProgressTracking)},
        {"progress_interval_ms", msSetter("progress_interval_ms", eng.progressInterval)},
        {"log_level",
         [&cfg](const std::string& value) -> Result<void> {
             auto level = parseLogLevel(value);
             if (!level) {
                 return Error{ErrorCode::InvalidData,
                              format("log_level: unknown level '{}'", value)};
             }
             cfg.logLevel = *level;
             return {};
         }},
    };

    const std::map<std::string, Setter> alignmentKeys = {
        {"case_sensitive", boolSetter("case_sensitive", aln.caseSensitive)},
        {"ignore_whitespace", boolSetter("ignore_whitespace", aln.ignoreWhitespace)},
        {"ignore_punctuation", boolSetter("ignore_punctuation", aln.ignorePunctuation)},
        {"max_distance", intSetter("max_distance", aln.maxDistance)},
        {"min_confidence", doubleSetter("min_confidence", aln.minConfidence)},
        {"max_candidates", intSetter("max_candidates", aln.maxCandidates)},
        {"window_size", intSetter("window_size", aln.windowSize)},
        {"timeout_ms", msSetter("timeout_ms", aln.timeout)},
    };

    auto& chk = eng.chunking;
    const std::map<std::string, Setter> chunkingKeys = {
        {"enabled", boolSetter("enabled", chk.enabled)},
        {"strategy",
         [&chk](const std::string& value) -> Result<void> {
             auto strategy = chunking::parseChunkingStrategy(value);
             if (!strategy) {
                 return Error{ErrorCode::InvalidData,
                              format("strategy: unknown strategy '{}'", value)};
             }
             chk.strategy = *strategy;
             return {};
         }},
        {"max_chunk_size", sizeSetter("max_chunk_size", chk.maxChunkSize)},
        {"min_chunk_size", sizeSetter("min_chunk_size", chk.minChunkSize)},
        {"overlap_ratio", doubleSetter("overlap_ratio", chk.overlapRatio)},
    };

    const std::map<std::string, Setter> gatewayKeys = {
        {"unhealthy_threshold", intSetter("unhealthy_threshold", gw.unhealthyThreshold)},
        {"recovery_threshold", intSetter("recovery_threshold", gw.recoveryThreshold)},
        {"initial_backoff_ms", msSetter("initial_backoff_ms", gw.initialBackoff)},
        {"backoff_multiplier", doubleSetter("backoff_multiplier", gw.backoffMultiplier)},
        {"max_backoff_ms", msSetter("max_backoff_ms", gw.maxBackoff)},
        {"enable_caching", boolSetter("enable_caching", gw.enableCaching)},
        {"cache_max_entries", sizeSetter("cache_max_entries", gw.cache.maxEntries)},
        {"cache_ttl_ms", msSetter("cache_ttl_ms", gw.cache.ttl)},
    };

    if (auto r = applySection("engine", read_config_section(path, "engine"), engineKeys); !r) {
        return r.error();
    }
    if (auto r = applySection("alignment", read_config_section(path, "alignment"), alignmentKeys);
        !r) {
        return r.error();
    }
    if (auto r = applySection("chunking", read_config_section(path, "chunking"), chunkingKeys);
        !r) {
        return r.error();
    }
    if (auto r = applySection("gateway", read_config_section(path, "gateway"), gatewayKeys); !r) {
        return r.error();
    }

    if (auto valid = eng.validate(); !valid) {
        return Error{ErrorCode::InvalidData,
                     format("{}: {}", path.string(), valid.error().message)};
    }
    if (gw.unhealthyThreshold < 1 || gw.recoveryThreshold < 1 || gw.backoffMultiplier < 1.0) {
        return Error{ErrorCode::InvalidData,
                     format("{}: gateway thresholds must be >= 1", path.string())};
    }

    spdlog::debug("loaded configuration from {}", path.string());
    return cfg;
}

Result<EngineConfig> resolveEngineConfig(const std::string& overridePath) {
    const char* envPath = std::getenv("LANGEXTRACT_CONFIG");
    const bool explicitPath = !overridePath.empty() || (envPath && *envPath);
    const auto path = get_config_path(overridePath);

    EngineConfig cfg;
    std::error_code ec;
    if (explicitPath || std::filesystem::exists(path, ec)) {
        auto loaded = loadEngineConfig(path);
        if (!loaded) {
            return loaded.error();
        }
        cfg = std::move(loaded).value();
    }

    if (const char* level = std::getenv("LANGEXTRACT_LOG_LEVEL"); level && *level) {
        auto parsed = parseLogLevel(level);
        if (!parsed) {
            return Error{ErrorCode::InvalidData,
                         format("LANGEXTRACT_LOG_LEVEL: unknown level '{}'", level)};
        }
        cfg.logLevel = *parsed;
    }
    return cfg;
}

} // namespace langextract::config
