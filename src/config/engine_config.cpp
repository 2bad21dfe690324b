#include <sieve/config/engine_config.h>

#include <cctype>
#include <functional>
#include <vector>
#include <spdlog/spdlog.h>

namespace sieve::config {

namespace {

using Setter = std::function<Result<void>(EngineConfig&, const std::string&)>;

struct Field {
    const char* section;
    const char* key;
    Setter set;
};

template <typename Parse, typename Assign> Setter makeSetter(Parse parse, Assign assign) {
    return [parse, assign](EngineConfig& c, const std::string& raw) -> Result<void> {
        auto parsed = parse(raw);
        if (!parsed)
            return parsed.error();
        assign(c, parsed.value());
        return Result<void>();
    };
}

Result<size_t> sizeValue(const std::string& s) {
    return parse_size(s);
}
Result<double> doubleValue(const std::string& s) {
    return parse_double(s);
}
Result<bool> boolValue(const std::string& s) {
    return parse_bool(s);
}
Result<std::chrono::milliseconds> msValue(const std::string& s) {
    return parse_ms(s);
}
Result<std::chrono::seconds> secondsValue(const std::string& s) {
    auto n = parse_size(s);
    if (!n)
        return n.error();
    return std::chrono::seconds(static_cast<int64_t>(n.value()));
}

void addBreakerFields(std::vector<Field>& fields, const char* section,
                      resilience::CircuitBreakerConfig EngineConfig::*member) {
    fields.push_back({section, "failure_threshold",
                      makeSetter(sizeValue, [member](EngineConfig& c, size_t v) {
                          (c.*member).failureThreshold = v;
                      })});
    fields.push_back({section, "failure_window_ms",
                      makeSetter(msValue, [member](EngineConfig& c, std::chrono::milliseconds v) {
                          (c.*member).failureWindow = v;
                      })});
    fields.push_back({section, "recovery_timeout_ms",
                      makeSetter(msValue, [member](EngineConfig& c, std::chrono::milliseconds v) {
                          (c.*member).recoveryTimeout = v;
                      })});
}

const std::vector<Field>& fields() {
    static const std::vector<Field> all = [] {
        using ms = std::chrono::milliseconds;
        std::vector<Field> f;

        // [engine]
        f.push_back({"engine", "worker_threads",
                     makeSetter(sizeValue, [](EngineConfig& c, size_t v) { c.workerThreads = v; })});
        f.push_back({"engine", "default_limit", makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.defaultResultLimit = v;
                     })});
        f.push_back({"engine", "max_limit",
                     makeSetter(sizeValue, [](EngineConfig& c, size_t v) { c.maxResultLimit = v; })});
        f.push_back({"engine", "candidate_pool", makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.candidatePoolSize = v;
                     })});
        f.push_back({"engine", "rerank_top_k", makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.defaultRerankTopK = v;
                     })});
        f.push_back({"engine", "diversity_lambda",
                     [](EngineConfig& c, const std::string& raw) -> Result<void> {
                         if (raw.empty() || raw == "none") {
                             c.defaultDiversityLambda.reset();
                             return Result<void>();
                         }
                         auto v = parse_double(raw);
                         if (!v)
                             return v.error();
                         c.defaultDiversityLambda = v.value();
                         return Result<void>();
                     }});
        f.push_back({"engine", "backend_timeout_ms",
                     makeSetter(msValue, [](EngineConfig& c, ms v) { c.backendTimeout = v; })});
        f.push_back({"engine", "embed_timeout_ms",
                     makeSetter(msValue, [](EngineConfig& c, ms v) { c.embedTimeout = v; })});
        f.push_back({"engine", "request_timeout_ms",
                     makeSetter(msValue, [](EngineConfig& c, ms v) { c.requestTimeout = v; })});
        f.push_back({"engine", "stale_similarity_floor",
                     makeSetter(doubleValue,
                                [](EngineConfig& c, double v) { c.staleSimilarityFloor = v; })});

        // [cache]
        f.push_back({"cache", "capacity",
                     makeSetter(sizeValue, [](EngineConfig& c, size_t v) { c.cache.capacity = v; })});
        f.push_back({"cache", "ttl_seconds",
                     makeSetter(secondsValue,
                                [](EngineConfig& c, std::chrono::seconds v) { c.cache.ttl = v; })});
        f.push_back({"cache", "persist_path", [](EngineConfig& c, const std::string& raw) {
                         c.cachePersistPath = raw.empty() ? std::filesystem::path{} : expand_tilde(raw);
                         return Result<void>();
                     }});

        // [semantic_cache]
        f.push_back({"semantic_cache", "enabled", makeSetter(boolValue, [](EngineConfig& c, bool v) {
                         c.enableSemanticCache = v;
                     })});
        f.push_back({"semantic_cache", "capacity", makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.semanticCache.capacity = v;
                     })});
        f.push_back({"semantic_cache", "similarity_threshold",
                     makeSetter(doubleValue, [](EngineConfig& c, double v) {
                         c.semanticCache.similarityThreshold = v;
                     })});
        f.push_back({"semantic_cache", "ttl_seconds",
                     makeSetter(secondsValue, [](EngineConfig& c, std::chrono::seconds v) {
                         c.semanticCache.ttl = v;
                     })});

        addBreakerFields(f, "circuit_breaker", &EngineConfig::vectorBreaker);
        addBreakerFields(f, "embedding_breaker", &EngineConfig::embeddingBreaker);

        // [retry]
        f.push_back({"retry", "max_attempts", makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.retry.maxAttempts = v;
                     })});
        f.push_back({"retry", "initial_wait_ms",
                     makeSetter(msValue, [](EngineConfig& c, ms v) { c.retry.initialWait = v; })});
        f.push_back({"retry", "max_wait_ms",
                     makeSetter(msValue, [](EngineConfig& c, ms v) { c.retry.maxWait = v; })});
        f.push_back({"retry", "multiplier",
                     makeSetter(doubleValue, [](EngineConfig& c, double v) { c.retry.multiplier = v; })});
        f.push_back({"retry", "jitter_min",
                     makeSetter(doubleValue, [](EngineConfig& c, double v) { c.retry.jitterMin = v; })});
        f.push_back({"retry", "jitter_max",
                     makeSetter(doubleValue, [](EngineConfig& c, double v) { c.retry.jitterMax = v; })});

        // [fusion]
        f.push_back({"fusion", "strategy", [](EngineConfig& c, const std::string& raw) -> Result<void> {
                         if (raw == "rrf" || raw == "reciprocal_rank") {
                             c.fusion.strategy = search::FusionStrategy::ReciprocalRank;
                         } else if (raw == "linear") {
                             c.fusion.strategy = search::FusionStrategy::LinearCombination;
                         } else {
                             return Error{ErrorCode::InvalidArgument,
                                          "fusion.strategy must be 'rrf' or 'linear'"};
                         }
                         return Result<void>();
                     }});
        f.push_back({"fusion", "rrf_k",
                     makeSetter(doubleValue, [](EngineConfig& c, double v) { c.fusion.rrfK = v; })});
        f.push_back({"fusion", "vector_weight", makeSetter(doubleValue, [](EngineConfig& c, double v) {
                         c.fusion.vectorWeight = v;
                     })});

        // [rerank]
        f.push_back({"rerank", "batch_size", makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.rerank.batchSize = v;
                     })});
        f.push_back({"rerank", "timeout_ms",
                     makeSetter(msValue, [](EngineConfig& c, ms v) { c.rerank.timeout = v; })});
        f.push_back({"rerank", "workers", makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.rerank.workerThreads = v;
                     })});

        // [expansion]
        f.push_back({"expansion", "enabled",
                     makeSetter(boolValue, [](EngineConfig& c, bool v) { c.expansion.enabled = v; })});
        f.push_back({"expansion", "use_synonyms", makeSetter(boolValue, [](EngineConfig& c, bool v) {
                         c.expansion.useSynonyms = v;
                     })});
        f.push_back({"expansion", "use_acronyms", makeSetter(boolValue, [](EngineConfig& c, bool v) {
                         c.expansion.useAcronyms = v;
                     })});
        f.push_back({"expansion", "max_expansion_factor",
                     makeSetter(doubleValue, [](EngineConfig& c, double v) {
                         c.expansion.maxExpansionFactor = v;
                     })});
        f.push_back({"expansion", "max_synonyms_per_term",
                     makeSetter(sizeValue, [](EngineConfig& c, size_t v) {
                         c.expansion.maxSynonymsPerTerm = v;
                     })});
        f.push_back({"expansion", "min_frequency", makeSetter(doubleValue, [](EngineConfig& c, double v) {
                         c.expansion.minFrequency = v;
                     })});

        // [logging]
        f.push_back({"logging", "level", [](EngineConfig& c, const std::string& raw) {
                         c.logLevel = raw;
                         return Result<void>();
                     }});
        return f;
    }();
    return all;
}

std::string envName(const char* section, const char* key) {
    std::string name = "SIEVE_";
    for (const char* p : {section, "_", key}) {
        for (; *p; ++p)
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(*p)));
    }
    return name;
}

Result<void> withContext(Result<void> r, const std::string& where) {
    if (r)
        return r;
    return Error{r.error().code, where + ": " + r.error().message};
}

} // namespace

Result<void> EngineConfig::validate() const {
    auto invalid = [](const std::string& msg) { return Error{ErrorCode::InvalidArgument, msg}; };

    if (workerThreads == 0)
        return invalid("engine.worker_threads must be > 0");
    if (defaultResultLimit == 0 || defaultResultLimit > maxResultLimit)
        return invalid("engine.default_limit must be in [1, engine.max_limit]");
    if (candidatePoolSize == 0)
        return invalid("engine.candidate_pool must be > 0");
    if (defaultDiversityLambda && !(*defaultDiversityLambda >= 0.0 && *defaultDiversityLambda <= 1.0))
        return invalid("engine.diversity_lambda must be in [0, 1]");
    if (backendTimeout.count() <= 0 || embedTimeout.count() <= 0 || requestTimeout.count() <= 0)
        return invalid("engine timeouts must be > 0");
    if (backendTimeout > requestTimeout)
        return invalid("engine.backend_timeout_ms must not exceed engine.request_timeout_ms");
    if (!(staleSimilarityFloor >= 0.0 && staleSimilarityFloor <= 1.0))
        return invalid("engine.stale_similarity_floor must be in [0, 1]");
    if (cache.capacity == 0)
        return invalid("cache.capacity must be > 0");
    if (semanticCache.capacity == 0)
        return invalid("semantic_cache.capacity must be > 0");
    if (!(semanticCache.similarityThreshold >= 0.0 && semanticCache.similarityThreshold <= 1.0))
        return invalid("semantic_cache.similarity_threshold must be in [0, 1]");
    for (const auto* b : {&vectorBreaker, &embeddingBreaker}) {
        if (b->failureThreshold == 0)
            return invalid("circuit breaker failure_threshold must be > 0");
        if (b->failureWindow.count() <= 0 || b->recoveryTimeout.count() <= 0)
            return invalid("circuit breaker window and recovery timeout must be > 0");
    }
    if (auto r = retry.validate(); !r)
        return r;
    if (fusion.rrfK <= 0.0)
        return invalid("fusion.rrf_k must be > 0");
    if (!(fusion.vectorWeight >= 0.0 && fusion.vectorWeight <= 1.0))
        return invalid("fusion.vector_weight must be in [0, 1]");
    if (rerank.batchSize == 0)
        return invalid("rerank.batch_size must be > 0");
    if (rerank.timeout.count() <= 0)
        return invalid("rerank.timeout_ms must be > 0");
    if (expansion.maxExpansionFactor < 1.0)
        return invalid("expansion.max_expansion_factor must be >= 1");
    return Result<void>();
}

Result<void> apply_config_table(EngineConfig& config, const ConfigTable& table) {
    for (const auto& [section, values] : table) {
        for (const auto& [key, raw] : values) {
            const Field* match = nullptr;
            for (const auto& f : fields()) {
                if (section == f.section && key == f.key) {
                    match = &f;
                    break;
                }
            }
            if (!match) {
                spdlog::warn("Ignoring unknown config key {}.{}", section, key);
                continue;
            }
            if (auto r = withContext(match->set(config, raw), section + "." + key); !r)
                return r;
        }
    }
    return Result<void>();
}

Result<void> apply_env_overrides(EngineConfig& config) {
    for (const auto& f : fields()) {
        auto name = envName(f.section, f.key);
        const char* value = std::getenv(name.c_str());
        if (!value)
            continue;
        std::string raw(value);
        trim(raw);
        if (auto r = withContext(f.set(config, raw), name); !r)
            return r;
        spdlog::debug("Config override from {}", name);
    }
    return Result<void>();
}

Result<void> apply_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept that for the literal "off"
    if (parsed == spdlog::level::off && level != "off") {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + level};
    }
    spdlog::set_level(parsed);
    return Result<void>();
}

Result<EngineConfig> load_engine_config(const std::filesystem::path& path) {
    EngineConfig config;

    if (!path.empty()) {
        auto table = parse_config_file(path);
        if (table) {
            if (auto r = apply_config_table(config, table.value()); !r)
                return r.error();
        } else if (table.error().code == ErrorCode::NotFound) {
            spdlog::debug("No config file at {}, using defaults", path.string());
        } else {
            return table.error();
        }
    }

    if (auto r = apply_env_overrides(config); !r)
        return r.error();
    if (auto r = config.validate(); !r)
        return r.error();
    return config;
}

} // namespace sieve::config
