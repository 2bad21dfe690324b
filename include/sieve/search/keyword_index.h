#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <sieve/core/types.h>
#include <sieve/search/backends.h>

namespace sieve::search {

struct KeywordIndexConfig {
    float k1 = 1.2f;
    float b = 0.75f;
};

/**
 * @brief In-process BM25 index implementing IKeywordBackend.
 *
 * Term statistics are maintained incrementally on add/remove. Queries take a shared lock
 * and may run concurrently; mutations are exclusive.
 */
class InMemoryKeywordIndex final : public IKeywordBackend {
public:
    explicit InMemoryKeywordIndex(KeywordIndexConfig config = {});

    Result<std::vector<BackendCandidate>> query(const std::vector<std::string>& terms, size_t topK,
                                                std::stop_token stop) override;

    Result<void> addDocument(const std::string& id, const std::string& content,
                             const std::map<std::string, std::string>& metadata = {});
    Result<void> removeDocument(const std::string& id);
    Result<void> updateDocument(const std::string& id, const std::string& content,
                                const std::map<std::string, std::string>& metadata = {});
    void clear();

    size_t documentCount() const;
    size_t termCount() const;

private:
    struct Document {
        std::string content;
        std::map<std::string, std::string> metadata;
        std::unordered_map<std::string, size_t> termFreq;
        size_t length = 0;
    };

    // Requires mutex_ held exclusively.
    void unindex(const Document& doc);

    float idf(const std::string& term) const;

    KeywordIndexConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Document> documents_;
    std::unordered_map<std::string, size_t> documentFrequencies_;
    size_t totalLength_ = 0;
};

} // namespace sieve::search
