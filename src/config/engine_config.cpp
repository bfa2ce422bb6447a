#include <coderag/config/config_helpers.h>
#include <coderag/config/engine_config.h>

#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace coderag::config {

namespace {

template <typename T> Result<T> parseNumber(const std::string& key, const std::string& value) {
    T out{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid number for '" + key + "': '" + value + "'"};
    }
    return out;
}

template <> Result<double> parseNumber<double>(const std::string& key, const std::string& value) {
    try {
        std::size_t used = 0;
        double out = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return out;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid number for '" + key + "': '" + value + "'"};
    }
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument, "Invalid boolean for '" + key + "': '" + value + "'"};
}

// Assign a parsed number to target, or hand back the parse error
template <typename T, typename Target>
Result<void> assignNumber(Target& target, const std::string& key, const std::string& value) {
    auto parsed = parseNumber<T>(key, value);
    if (!parsed) {
        return parsed.error();
    }
    target = static_cast<Target>(parsed.value());
    return {};
}

template <typename Duration>
Result<void> assignDuration(Duration& target, const std::string& key, const std::string& value) {
    auto parsed = parseNumber<long long>(key, value);
    if (!parsed) {
        return parsed.error();
    }
    target = Duration(parsed.value());
    return {};
}

} // namespace

EngineConfig EngineConfig::defaults(const std::filesystem::path& data_dir) {
    EngineConfig config;
    config.storage.data_dir = data_dir;
    config.storage.context_dir = data_dir / "context";
    config.storage.dimension = config.embedding.dimension;
    config.lock.lock_dir = data_dir / "locks";
    return config;
}

Result<void> applySetting(EngineConfig& config, const std::string& section, const std::string& key,
                          const std::string& value) {
    const std::string name = section + "." + key;

    if (section == "chunking") {
        auto& c = config.chunking;
        if (key == "min_chunk_size")
            return assignNumber<std::size_t>(c.min_chunk_size, name, value);
        if (key == "max_chunk_size")
            return assignNumber<std::size_t>(c.max_chunk_size, name, value);
        if (key == "max_context_size")
            return assignNumber<std::size_t>(c.max_context_size, name, value);
        if (key == "fallback_window_lines")
            return assignNumber<std::size_t>(c.fallback_window_lines, name, value);
    } else if (section == "search") {
        auto& s = config.search;
        if (key == "default_top_k")
            return assignNumber<std::size_t>(s.default_top_k, name, value);
        if (key == "oversample_factor")
            return assignNumber<std::size_t>(s.oversample_factor, name, value);
        if (key == "rrf_k")
            return assignNumber<double>(s.fusion.k, name, value);
        if (key == "vector_weight")
            return assignNumber<double>(s.fusion.vector_weight, name, value);
        if (key == "lexical_weight")
            return assignNumber<double>(s.fusion.lexical_weight, name, value);
        if (key == "bm25_k1")
            return assignNumber<double>(s.bm25.k1, name, value);
        if (key == "bm25_b")
            return assignNumber<double>(s.bm25.b, name, value);
        if (key == "bm25_epsilon")
            return assignNumber<double>(s.bm25.epsilon, name, value);
        if (key == "extra_word_chars") {
            s.tokenizer.extra_word_chars = value;
            return {};
        }
        if (key == "non_ascii_is_word") {
            auto flag = parseBool(name, value);
            if (!flag) {
                return flag.error();
            }
            s.tokenizer.non_ascii_is_word = flag.value();
            return {};
        }
    } else if (section == "embedding") {
        auto& e = config.embedding;
        if (key == "batch_size")
            return assignNumber<std::size_t>(e.batch_size, name, value);
        if (key == "max_text_length")
            return assignNumber<std::size_t>(e.max_text_length, name, value);
        if (key == "max_concurrent_batches")
            return assignNumber<std::size_t>(e.max_concurrent_batches, name, value);
        if (key == "timeout_ms")
            return assignDuration(e.timeout, name, value);
        if (key == "retry_attempts")
            return assignNumber<int>(e.retry.max_attempts, name, value);
        if (key == "retry_initial_ms")
            return assignDuration(e.retry.initial_delay, name, value);
        if (key == "retry_multiplier")
            return assignNumber<double>(e.retry.multiplier, name, value);
        if (key == "retry_max_ms")
            return assignDuration(e.retry.max_delay, name, value);
        if (key == "dimension") {
            auto r = assignNumber<std::size_t>(e.dimension, name, value);
            if (r) {
                config.storage.dimension = e.dimension;
            }
            return r;
        }
    } else if (section == "storage") {
        auto& s = config.storage;
        if (key == "backend") {
            auto type = storage::documentStoreTypeFromString(value);
            if (!type) {
                return type.error();
            }
            s.backend = type.value();
            return {};
        }
        if (key == "data_dir") {
            s.data_dir = expand_tilde(value);
            return {};
        }
        if (key == "context_dir") {
            s.context_dir = expand_tilde(value);
            return {};
        }
        if (key == "dimension")
            return assignNumber<std::size_t>(s.dimension, name, value);
        if (key == "write_batch_size")
            return assignNumber<std::size_t>(s.write_batch_size, name, value);
        if (key == "cache_format_version") {
            s.cache_format_version = value;
            return {};
        }
    } else if (section == "session") {
        if (key == "max_sessions")
            return assignNumber<std::size_t>(config.session.max_sessions, name, value);
        if (key == "worker_threads")
            return assignNumber<std::size_t>(config.session.worker_threads, name, value);
    } else if (section == "lock") {
        auto& l = config.lock;
        if (key == "backend") {
            auto type = lock::lockBackendFromString(value);
            if (!type) {
                return type.error();
            }
            l.backend = type.value();
            return {};
        }
        if (key == "lock_dir") {
            l.lock_dir = expand_tilde(value);
            return {};
        }
        if (key == "redis_url") {
            l.redis_url = value;
            return {};
        }
        if (key == "lock_ttl_seconds")
            return assignDuration(l.lock_ttl, name, value);
        if (key == "acquire_timeout_seconds")
            return assignDuration(l.acquire_timeout, name, value);
        if (key == "poll_interval_ms")
            return assignDuration(l.poll_interval, name, value);
    }

    spdlog::debug("Ignoring unknown config key {}", name);
    return {};
}

Result<void> applyEnvironmentOverrides(EngineConfig& config) {
    struct Override {
        const char* env;
        const char* section;
        const char* key;
    };
    static constexpr Override kOverrides[] = {
        {"CODERAG_STORAGE_BACKEND", "storage", "backend"},
        {"CODERAG_CONTEXT_DIR", "storage", "context_dir"},
        {"CODERAG_EMBEDDING_DIMENSION", "embedding", "dimension"},
        {"CODERAG_MAX_SESSIONS", "session", "max_sessions"},
        {"CODERAG_WORKER_THREADS", "session", "worker_threads"},
        {"CODERAG_LOCK_BACKEND", "lock", "backend"},
        {"CODERAG_LOCK_DIR", "lock", "lock_dir"},
        {"CODERAG_REDIS_URL", "lock", "redis_url"},
        {"CODERAG_LOCK_TIMEOUT", "lock", "lock_ttl_seconds"},
        {"CODERAG_LOCK_ACQUIRE_TIMEOUT", "lock", "acquire_timeout_seconds"},
    };
    for (const auto& o : kOverrides) {
        const char* value = std::getenv(o.env);
        if (!value || !*value) {
            continue;
        }
        if (auto r = applySetting(config, o.section, o.key, value); !r) {
            return Error{r.error().code, std::string(o.env) + ": " + r.error().message};
        }
    }
    return {};
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& config_path) {
    auto path = config_path.empty() ? get_config_path() : config_path;
    auto values = load_config_values(path);

    // data_dir decides the defaults of the other directories, so resolve it first
    std::filesystem::path data_dir = get_data_dir();
    if (const char* env = std::getenv("CODERAG_DATA_DIR"); env && *env) {
        data_dir = expand_tilde(env);
    } else if (auto sec = values.find("storage"); sec != values.end()) {
        if (auto it = sec->second.find("data_dir"); it != sec->second.end() && !it->second.empty()) {
            data_dir = expand_tilde(it->second);
        }
    }

    auto config = EngineConfig::defaults(data_dir);
    for (const auto& [section, entries] : values) {
        for (const auto& [key, value] : entries) {
            if (section == "storage" && key == "data_dir") {
                continue;
            }
            if (auto r = applySetting(config, section, key, value); !r) {
                return r.error();
            }
        }
    }
    if (auto r = applyEnvironmentOverrides(config); !r) {
        return r.error();
    }

    if (!values.empty()) {
        spdlog::debug("Loaded configuration from {}", path.string());
    }
    return config;
}

} // namespace coderag::config
