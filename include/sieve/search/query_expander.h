#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sieve::search {

enum class PartOfSpeech { Unknown, Noun, Verb, Adjective, Adverb };

struct RelatedTerm {
    std::string term;
    PartOfSpeech pos = PartOfSpeech::Unknown;
    /// Relative usage frequency in [0, 1].
    double frequency = 0.0;
};

struct LexicalEntry {
    PartOfSpeech pos = PartOfSpeech::Unknown;
    std::vector<RelatedTerm> related;
};

/**
 * @brief Lexical database consulted for synonyms. Must be safe for concurrent lookups.
 */
class ISynonymSource {
public:
    virtual ~ISynonymSource() = default;
    virtual std::optional<LexicalEntry> lookup(const std::string& word) const = 0;
};

/**
 * @brief Synonym source backed by an in-memory table; ships a small general thesaurus.
 */
class StaticSynonymSource final : public ISynonymSource {
public:
    StaticSynonymSource();
    explicit StaticSynonymSource(std::unordered_map<std::string, LexicalEntry> table);

    std::optional<LexicalEntry> lookup(const std::string& word) const override;

    static std::unordered_map<std::string, LexicalEntry> defaultTable();

private:
    std::unordered_map<std::string, LexicalEntry> table_;
};

struct QueryExpanderConfig {
    bool enabled = true;
    bool useSynonyms = true;
    bool useAcronyms = true;
    /// Output never exceeds maxExpansionFactor * number of original terms.
    double maxExpansionFactor = 3.0;
    size_t maxSynonymsPerTerm = 3;
    double minFrequency = 0.1;
    std::map<std::string, std::string> acronyms = defaultAcronyms();

    static std::map<std::string, std::string> defaultAcronyms();
};

struct ExpansionResult {
    std::string originalQuery;
    std::vector<std::string> originalTerms;
    std::vector<std::string> expansionTerms;
    std::map<std::string, std::string> acronymExpansions;
    std::string expandedQuery;

    size_t totalExpansions() const { return expansionTerms.size(); }

    /// Original terms followed by expansions.
    std::vector<std::string> allTerms() const;
};

/**
 * @brief Adds synonyms and acronym expansions to a query for the keyword path.
 *
 * Holds only immutable state after construction, so one instance serves all requests.
 * Terms are lower-cased; stopwords are neither looked up nor kept unless the query has
 * nothing else. Original terms always come first and the list carries no duplicates.
 */
class QueryExpander {
public:
    struct Stats {
        bool enabled = false;
        bool useSynonyms = false;
        bool useAcronyms = false;
        double maxExpansionFactor = 0.0;
        size_t acronymCount = 0;
        bool synonymSourceAvailable = false;
    };

    explicit QueryExpander(QueryExpanderConfig config = {},
                           std::shared_ptr<const ISynonymSource> synonyms = nullptr);

    std::vector<std::string> expand(const std::string& query) const;

    ExpansionResult expandDetailed(const std::string& query) const;

    /// "ml OR machine OR learning" style disjunction for backends with boolean syntax.
    std::string toOrQuery(const std::string& query) const;

    Stats stats() const;

    /// Lower-case, collapse whitespace and trim.
    static std::string normalize(const std::string& query);

    /// Lower-cased words with leading/trailing punctuation removed.
    static std::vector<std::string> tokenize(const std::string& text);

    static bool isStopword(const std::string& word);

private:
    static bool compatible(PartOfSpeech a, PartOfSpeech b);

    QueryExpanderConfig config_;
    std::shared_ptr<const ISynonymSource> synonyms_;
    std::map<std::string, std::string> acronyms_; // lower-cased keys
};

} // namespace sieve::search
