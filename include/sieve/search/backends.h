#pragma once

#include <stop_token>
#include <string>
#include <vector>
#include <sieve/core/types.h>
#include <sieve/search/search_candidate.h>

namespace sieve::search {

/**
 * @brief Approximate nearest neighbour search over document embeddings.
 *
 * Transient failures must be reported as NetworkError, Timeout, IOError or Unavailable.
 * Implementations should check @p stop between expensive steps.
 */
class IVectorBackend {
public:
    virtual ~IVectorBackend() = default;

    virtual Result<std::vector<BackendCandidate>> query(const std::vector<float>& embedding,
                                                        size_t topK, const SearchFilters& filters,
                                                        std::stop_token stop) = 0;
};

/**
 * @brief Term-based retrieval (BM25 or similar).
 */
class IKeywordBackend {
public:
    virtual ~IKeywordBackend() = default;

    virtual Result<std::vector<BackendCandidate>> query(const std::vector<std::string>& terms,
                                                        size_t topK, std::stop_token stop) = 0;
};

class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<std::vector<float>> embed(const std::string& text, std::stop_token stop) = 0;
};

/**
 * @brief Cross-encoder scoring of (query, document) pairs.
 */
class ICrossEncoder {
public:
    virtual ~ICrossEncoder() = default;

    /// One score per document, in input order.
    virtual Result<std::vector<float>> scoreDocuments(const std::string& query,
                                                      const std::vector<std::string>& documents) = 0;

    virtual bool isReady() const = 0;
};

} // namespace sieve::search
