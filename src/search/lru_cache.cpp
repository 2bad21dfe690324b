#include <sieve/search/lru_cache.h>

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sieve::search {

using json = nlohmann::json;

namespace {

constexpr int kCacheFileVersion = 1;

json optionalToJson(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

std::optional<double> optionalFromJson(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<double>();
}

json candidateToJson(const SearchCandidate& c) {
    json j;
    j["doc_id"] = c.docId;
    j["content"] = c.contentRef;
    j["vector_score"] = optionalToJson(c.vectorScore);
    j["keyword_score"] = optionalToJson(c.keywordScore);
    j["fused_score"] = c.fusedScore;
    j["rerank_score"] = optionalToJson(c.rerankScore);
    j["final_score"] = c.finalScore;
    j["rank"] = c.rank;
    j["metadata"] = c.metadata;
    return j;
}

SearchCandidate candidateFromJson(const json& j) {
    SearchCandidate c;
    c.docId = j.at("doc_id").get<std::string>();
    c.contentRef = j.value("content", std::string{});
    c.vectorScore = optionalFromJson(j, "vector_score");
    c.keywordScore = optionalFromJson(j, "keyword_score");
    c.fusedScore = j.at("fused_score").get<double>();
    c.rerankScore = optionalFromJson(j, "rerank_score");
    c.finalScore = j.at("final_score").get<double>();
    c.rank = j.at("rank").get<size_t>();
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        c.metadata = it->get<std::map<std::string, std::string>>();
    }
    return c;
}

} // namespace

LruCache::LruCache(LruCacheConfig config, ClockFn clock)
    : config_(config),
      clock_(clock ? std::move(clock) : ClockFn([] { return SteadyClock::now(); })) {
    if (config_.capacity == 0) {
        throw std::invalid_argument("LruCache: capacity must be > 0");
    }
    stats_.capacity = config_.capacity;
    index_.reserve(config_.capacity);
}

bool LruCache::isExpired(const Entry& entry, SteadyClock::time_point now) const {
    return config_.ttl.count() > 0 && now - entry.insertedAt > config_.ttl;
}

std::optional<LruCache::Value> LruCache::get(const CacheKey& key) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }
    if (isExpired(*it->second, now)) {
        // Kept in place so the stale fallback can still serve it
        ++stats_.misses;
        ++stats_.expirations;
        return std::nullopt;
    }

    lru_.splice(lru_.begin(), lru_, it->second);
    it->second->lastAccessedAt = now;
    ++stats_.hits;
    return it->second->value;
}

std::optional<LruCache::Value> LruCache::getStale(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
        return std::nullopt;
    return it->second->value;
}

void LruCache::put(const CacheKey& key, Value value) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->value = std::move(value);
        it->second->insertedAt = now;
        it->second->lastAccessedAt = now;
        lru_.splice(lru_.begin(), lru_, it->second);
        ++stats_.insertions;
        return;
    }

    lru_.push_front(Entry{key, std::move(value), now, now});
    index_.emplace(key, lru_.begin());
    ++stats_.insertions;
    evictOverflow();
}

void LruCache::evictOverflow() {
    while (lru_.size() > config_.capacity) {
        index_.erase(lru_.back().key);
        lru_.pop_back();
        ++stats_.evictions;
    }
}

bool LruCache::contains(const CacheKey& key) const {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    return it != index_.end() && !isExpired(*it->second, now);
}

void LruCache::invalidate(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
        return;
    lru_.erase(it->second);
    index_.erase(it);
    ++stats_.invalidations;
}

size_t LruCache::invalidatePattern(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (it->key.matchesPattern(pattern)) {
            index_.erase(it->key);
            it = lru_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.invalidations += removed;
    return removed;
}

size_t LruCache::removeExpired() {
    if (config_.ttl.count() <= 0)
        return 0;
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (isExpired(*it, now)) {
            index_.erase(it->key);
            it = lru_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.expirations += removed;
    return removed;
}

void LruCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

size_t LruCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

CacheStats LruCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s = stats_;
    s.size = lru_.size();
    return s;
}

std::vector<CacheKey> LruCache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheKey> out;
    out.reserve(lru_.size());
    for (const auto& e : lru_) {
        out.push_back(e.key);
    }
    return out;
}

Result<void> LruCache::saveToFile(const std::filesystem::path& path) const {
    std::vector<std::pair<CacheKey, Value>> snapshot;
    {
        auto now = clock_();
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(lru_.size());
        for (const auto& e : lru_) {
            if (!isExpired(e, now))
                snapshot.emplace_back(e.key, e.value);
        }
    }

    json root;
    root["version"] = kCacheFileVersion;
    root["capacity"] = config_.capacity;
    json entries = json::array();
    for (const auto& [key, value] : snapshot) {
        json results = json::array();
        for (const auto& c : value) {
            results.push_back(candidateToJson(c));
        }
        entries.push_back(
            {{"key", key.toString()}, {"fingerprint", key.paramFingerprint()}, {"results", results}});
    }
    root["entries"] = std::move(entries);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Failed to create cache directory: " + ec.message()};
        }
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IOError, "Failed to open cache file for writing: " + path.string()};
    }
    out << root.dump(2);
    if (!out) {
        return Error{ErrorCode::IOError, "Failed to write cache file: " + path.string()};
    }
    spdlog::debug("Saved {} cache entries to {}", snapshot.size(), path.string());
    return Result<void>();
}

Result<void> LruCache::loadFromFile(const std::filesystem::path& path) {
    clear();

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cache file not found: " + path.string()};
    }

    std::vector<std::pair<CacheKey, Value>> loaded;
    try {
        json root = json::parse(in);
        if (root.value("version", 0) != kCacheFileVersion) {
            spdlog::warn("Ignoring cache file {} with unsupported version", path.string());
            return Error{ErrorCode::InvalidData, "Unsupported cache file version"};
        }
        for (const auto& e : root.at("entries")) {
            Value results;
            for (const auto& r : e.at("results")) {
                results.push_back(candidateFromJson(r));
            }
            loaded.emplace_back(CacheKey::fromParts(e.at("key").get<std::string>(),
                                                    e.value("fingerprint", std::string{})),
                                std::move(results));
        }
    } catch (const json::exception& ex) {
        spdlog::warn("Corrupt cache file {}: {}", path.string(), ex.what());
        return Error{ErrorCode::InvalidData, std::string("Corrupt cache file: ") + ex.what()};
    }

    // File order is most recent first; insert in reverse to restore recency.
    // TTL restarts from load time.
    for (auto it = loaded.rbegin(); it != loaded.rend(); ++it) {
        put(it->first, std::move(it->second));
    }
    spdlog::debug("Loaded {} cache entries from {}", loaded.size(), path.string());
    return Result<void>();
}

} // namespace sieve::search
