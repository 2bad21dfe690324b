#include <sieve/search/semantic_cache.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace sieve::search {

SemanticCache::SemanticCache(SemanticCacheConfig config, ClockFn clock)
    : config_(config),
      clock_(clock ? std::move(clock) : ClockFn([] { return SteadyClock::now(); })) {
    if (config_.capacity == 0) {
        throw std::invalid_argument("SemanticCache: capacity must be > 0");
    }
    if (config_.similarityThreshold < 0.0 || config_.similarityThreshold > 1.0) {
        throw std::invalid_argument("SemanticCache: similarity threshold must be in [0, 1]");
    }
    stats_.capacity = config_.capacity;
}

double SemanticCache::cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size())
        return 0.0;
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0)
        return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

std::vector<float> SemanticCache::normalize(const std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v)
        norm += static_cast<double>(x) * x;
    if (norm <= 0.0)
        return {};
    norm = std::sqrt(norm);
    std::vector<float> out(v.size());
    for (size_t i = 0; i < v.size(); ++i)
        out[i] = static_cast<float>(v[i] / norm);
    return out;
}

std::string SemanticCache::queryIndexKey(const std::string& paramFingerprint,
                                         const std::string& queryText) {
    return paramFingerprint + '\x1f' + queryText;
}

bool SemanticCache::isExpired(const Entry& e, SteadyClock::time_point now) const {
    return config_.ttl.count() > 0 && now - e.insertedAt > config_.ttl;
}

std::vector<SemanticCache::EntryPtr> SemanticCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EntryPtr> out;
    out.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        out.push_back(slot.entry);
    }
    return out;
}

SemanticCache::Match SemanticCache::scan(const std::vector<EntryPtr>& entries,
                                         const std::vector<float>& unitQuery,
                                         const std::string& paramFingerprint,
                                         std::optional<SteadyClock::time_point> now) const {
    Match best;
    size_t dimensionMismatches = 0;
    for (const auto& e : entries) {
        if (e->paramFingerprint != paramFingerprint)
            continue;
        if (now && isExpired(*e, *now))
            continue;
        if (e->embedding.size() != unitQuery.size()) {
            ++dimensionMismatches;
            continue;
        }
        double dot = 0.0;
        for (size_t i = 0; i < unitQuery.size(); ++i)
            dot += static_cast<double>(unitQuery[i]) * e->embedding[i];
        // Ties go to the smaller id, i.e. the older entry, so results do not depend on map order
        if (dot > best.similarity || (dot == best.similarity && best.entry && e->id < best.entry->id)) {
            best.entry = e;
            best.similarity = dot;
        }
    }
    if (dimensionMismatches > 0) {
        spdlog::warn("Semantic cache skipped {} entries with embedding dimension != {}",
                     dimensionMismatches, unitQuery.size());
    }
    return best;
}

std::optional<SemanticHit> SemanticCache::get(const std::vector<float>& embedding,
                                              const std::string& paramFingerprint) {
    auto unit = normalize(embedding);
    if (unit.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.misses;
        return std::nullopt;
    }

    auto now = clock_();
    auto best = scan(snapshot(), unit, paramFingerprint, now);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!best.entry || best.similarity < config_.similarityThreshold) {
        ++stats_.misses;
        return std::nullopt;
    }

    // The entry may have been evicted since the snapshot; its results are still valid.
    auto it = slots_.find(best.entry->id);
    if (it != slots_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second.lruPos);
        ++it->second.hitCount;
    }
    ++stats_.hits;
    return SemanticHit{best.entry->results, best.similarity, best.entry->queryText};
}

std::optional<SemanticHit> SemanticCache::findClosest(const std::vector<float>& embedding,
                                                      const std::string& paramFingerprint,
                                                      double floor) {
    auto unit = normalize(embedding);
    if (unit.empty())
        return std::nullopt;
    auto best = scan(snapshot(), unit, paramFingerprint, std::nullopt);
    if (!best.entry || best.similarity < floor)
        return std::nullopt;
    return SemanticHit{best.entry->results, best.similarity, best.entry->queryText};
}

void SemanticCache::put(const std::vector<float>& embedding, const std::string& paramFingerprint,
                        const std::string& queryText, std::vector<SearchCandidate> results) {
    auto unit = normalize(embedding);
    if (unit.empty()) {
        spdlog::debug("Semantic cache ignoring zero-norm embedding for '{}'", queryText);
        return;
    }

    auto entry = std::make_shared<Entry>();
    entry->embedding = std::move(unit);
    entry->paramFingerprint = paramFingerprint;
    entry->queryText = queryText;
    entry->results = std::move(results);
    entry->insertedAt = clock_();

    auto indexKey = queryIndexKey(paramFingerprint, queryText);

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t previousHits = 0;
    if (auto existing = byQuery_.find(indexKey); existing != byQuery_.end()) {
        auto slotIt = slots_.find(existing->second);
        if (slotIt != slots_.end())
            previousHits = slotIt->second.hitCount;
        eraseSlot(existing->second);
    }

    entry->id = nextId_++;
    lru_.push_front(entry->id);
    slots_.emplace(entry->id, Slot{entry, lru_.begin(), previousHits});
    byQuery_[indexKey] = entry->id;
    ++stats_.insertions;

    while (lru_.size() > config_.capacity) {
        eraseSlot(lru_.back());
        ++stats_.evictions;
    }
}

void SemanticCache::eraseSlot(uint64_t id) {
    auto it = slots_.find(id);
    if (it == slots_.end())
        return;
    const auto& e = *it->second.entry;
    auto q = byQuery_.find(queryIndexKey(e.paramFingerprint, e.queryText));
    if (q != byQuery_.end() && q->second == id)
        byQuery_.erase(q);
    lru_.erase(it->second.lruPos);
    slots_.erase(it);
}

std::vector<std::pair<std::string, uint64_t>> SemanticCache::topQueries(size_t n) const {
    std::vector<std::pair<std::string, uint64_t>> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            out.emplace_back(slot.entry->queryText, slot.hitCount);
        }
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second)
            return a.second > b.second;
        return a.first < b.first;
    });
    if (out.size() > n)
        out.resize(n);
    return out;
}

size_t SemanticCache::removeExpired() {
    if (config_.ttl.count() <= 0)
        return 0;
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> expired;
    for (const auto& [id, slot] : slots_) {
        if (isExpired(*slot.entry, now))
            expired.push_back(id);
    }
    for (auto id : expired)
        eraseSlot(id);
    stats_.expirations += expired.size();
    return expired.size();
}

void SemanticCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
    byQuery_.clear();
    lru_.clear();
}

size_t SemanticCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

CacheStats SemanticCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s = stats_;
    s.size = slots_.size();
    return s;
}

} // namespace sieve::search
