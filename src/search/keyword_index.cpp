#include <sieve/search/keyword_index.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <sieve/search/query_expander.h>

namespace sieve::search {

InMemoryKeywordIndex::InMemoryKeywordIndex(KeywordIndexConfig config) : config_(config) {}

Result<void> InMemoryKeywordIndex::addDocument(const std::string& id, const std::string& content,
                                               const std::map<std::string, std::string>& metadata) {
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Document id must not be empty"};
    }

    Document doc;
    doc.content = content;
    doc.metadata = metadata;
    for (auto& term : QueryExpander::tokenize(content)) {
        doc.termFreq[term]++;
        doc.length++;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto existing = documents_.find(id);
    if (existing != documents_.end()) {
        unindex(existing->second);
        documents_.erase(existing);
    }
    for (const auto& [term, tf] : doc.termFreq) {
        documentFrequencies_[term]++;
    }
    totalLength_ += doc.length;
    documents_.emplace(id, std::move(doc));
    return Result<void>();
}

Result<void> InMemoryKeywordIndex::removeDocument(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = documents_.find(id);
    if (it == documents_.end()) {
        return Error{ErrorCode::NotFound, "Document not found: " + id};
    }
    unindex(it->second);
    documents_.erase(it);
    return Result<void>();
}

Result<void> InMemoryKeywordIndex::updateDocument(const std::string& id,
                                                  const std::string& content,
                                                  const std::map<std::string, std::string>& metadata) {
    // addDocument replaces an existing document atomically
    return addDocument(id, content, metadata);
}

void InMemoryKeywordIndex::unindex(const Document& doc) {
    for (const auto& [term, tf] : doc.termFreq) {
        auto df = documentFrequencies_.find(term);
        if (df == documentFrequencies_.end())
            continue;
        if (df->second <= 1) {
            documentFrequencies_.erase(df);
        } else {
            df->second--;
        }
    }
    totalLength_ -= std::min(totalLength_, doc.length);
}

void InMemoryKeywordIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    documents_.clear();
    documentFrequencies_.clear();
    totalLength_ = 0;
}

size_t InMemoryKeywordIndex::documentCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return documents_.size();
}

size_t InMemoryKeywordIndex::termCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return documentFrequencies_.size();
}

float InMemoryKeywordIndex::idf(const std::string& term) const {
    auto it = documentFrequencies_.find(term);
    float df = it != documentFrequencies_.end() ? static_cast<float>(it->second) : 0.0f;
    float n = static_cast<float>(documents_.size());
    // +1 keeps idf positive for terms present in most documents of a small corpus
    return std::log(1.0f + (n - df + 0.5f) / (df + 0.5f));
}

Result<std::vector<BackendCandidate>>
InMemoryKeywordIndex::query(const std::vector<std::string>& terms, size_t topK,
                            std::stop_token stop) {
    std::vector<std::string> queryTerms;
    for (const auto& t : terms) {
        for (auto& tok : QueryExpander::tokenize(t)) {
            if (std::find(queryTerms.begin(), queryTerms.end(), tok) == queryTerms.end())
                queryTerms.push_back(std::move(tok));
        }
    }
    if (queryTerms.empty() || topK == 0) {
        return std::vector<BackendCandidate>{};
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (documents_.empty()) {
        return std::vector<BackendCandidate>{};
    }

    const float avgLength =
        static_cast<float>(totalLength_) / static_cast<float>(documents_.size());
    std::vector<float> idfs;
    idfs.reserve(queryTerms.size());
    for (const auto& t : queryTerms)
        idfs.push_back(idf(t));

    std::vector<std::pair<float, const std::string*>> scores;
    size_t visited = 0;
    for (const auto& [id, doc] : documents_) {
        if ((++visited & 0xFF) == 0 && stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "keyword query cancelled"};
        }
        float score = 0.0f;
        for (size_t i = 0; i < queryTerms.size(); ++i) {
            auto tfIt = doc.termFreq.find(queryTerms[i]);
            if (tfIt == doc.termFreq.end())
                continue;
            float tf = static_cast<float>(tfIt->second);
            float lengthNorm = avgLength > 0.0f ? static_cast<float>(doc.length) / avgLength : 1.0f;
            float normalizedTf =
                (tf * (config_.k1 + 1.0f)) /
                (tf + config_.k1 * (1.0f - config_.b + config_.b * lengthNorm));
            score += idfs[i] * normalizedTf;
        }
        if (score > 0.0f) {
            scores.emplace_back(score, &id);
        }
    }

    std::sort(scores.begin(), scores.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first)
            return a.first > b.first;
        return *a.second < *b.second;
    });

    const size_t count = std::min(topK, scores.size());
    std::vector<BackendCandidate> results;
    results.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const auto& doc = documents_.at(*scores[i].second);
        BackendCandidate c;
        c.docId = *scores[i].second;
        c.score = scores[i].first;
        c.content = doc.content;
        c.metadata = doc.metadata;
        results.push_back(std::move(c));
    }
    return results;
}

} // namespace sieve::search
