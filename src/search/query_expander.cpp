#include <sieve/search/query_expander.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace sieve::search {

namespace {

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> stops = {
        "the",     "a",      "an",     "is",    "are",   "was",  "were",  "be",    "been",
        "being",   "have",   "has",    "had",   "do",    "does", "did",   "will",  "would",
        "shall",   "should", "may",    "might", "must",  "can",  "could", "in",    "on",
        "at",      "to",     "for",    "of",    "with",  "by",   "from",  "as",    "into",
        "through", "during", "before", "after", "about", "i",    "me",    "my",    "we",
        "our",     "you",    "your",   "it",    "its",   "this", "that",  "these", "those",
        "what",    "which",  "who",    "how",   "where", "when", "why",   "and",   "or",
        "but",     "not",    "no",     "nor",   "all",   "each", "every", "any",   "both",
    };
    return stops;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ---------------------------------------------------------------------------
// StaticSynonymSource
// ---------------------------------------------------------------------------

StaticSynonymSource::StaticSynonymSource() : table_(defaultTable()) {}

StaticSynonymSource::StaticSynonymSource(std::unordered_map<std::string, LexicalEntry> table)
    : table_(std::move(table)) {}

std::optional<LexicalEntry> StaticSynonymSource::lookup(const std::string& word) const {
    auto it = table_.find(word);
    if (it == table_.end())
        return std::nullopt;
    return it->second;
}

std::unordered_map<std::string, LexicalEntry> StaticSynonymSource::defaultTable() {
    using P = PartOfSpeech;
    return {
        {"fast", {P::Adjective, {{"quick", P::Adjective, 0.9}, {"rapid", P::Adjective, 0.7},
                                 {"speedy", P::Adjective, 0.4}, {"fasting", P::Noun, 0.3}}}},
        {"quick", {P::Adjective, {{"fast", P::Adjective, 0.9}, {"rapid", P::Adjective, 0.6},
                                  {"nimble", P::Adjective, 0.05}}}},
        {"rapid", {P::Adjective, {{"fast", P::Adjective, 0.8}, {"swift", P::Adjective, 0.5}}}},
        {"car", {P::Noun, {{"automobile", P::Noun, 0.8}, {"vehicle", P::Noun, 0.6},
                           {"auto", P::Noun, 0.4}}}},
        {"run", {P::Verb, {{"execute", P::Verb, 0.7}, {"operate", P::Verb, 0.5},
                           {"race", P::Noun, 0.6}}}},
        {"algorithm", {P::Noun, {{"procedure", P::Noun, 0.6}, {"method", P::Noun, 0.5}}}},
        {"error", {P::Noun, {{"fault", P::Noun, 0.6}, {"mistake", P::Noun, 0.5},
                             {"bug", P::Noun, 0.4}}}},
        {"search", {P::Noun, {{"lookup", P::Noun, 0.5}, {"query", P::Noun, 0.5},
                              {"retrieval", P::Noun, 0.3}}}},
        {"document", {P::Noun, {{"file", P::Noun, 0.6}, {"record", P::Noun, 0.4}}}},
        {"basics", {P::Noun, {{"fundamentals", P::Noun, 0.6}, {"essentials", P::Noun, 0.4}}}},
        {"learning", {P::Noun, {{"training", P::Noun, 0.5}, {"study", P::Noun, 0.4}}}},
        {"model", {P::Noun, {{"network", P::Noun, 0.3}, {"architecture", P::Noun, 0.2}}}},
        {"create", {P::Verb, {{"make", P::Verb, 0.8}, {"build", P::Verb, 0.6},
                              {"generate", P::Verb, 0.5}}}},
        {"delete", {P::Verb, {{"remove", P::Verb, 0.8}, {"erase", P::Verb, 0.4}}}},
        {"big", {P::Adjective, {{"large", P::Adjective, 0.9}, {"huge", P::Adjective, 0.5}}}},
        {"small", {P::Adjective, {{"little", P::Adjective, 0.7}, {"tiny", P::Adjective, 0.4}}}},
    };
}

// ---------------------------------------------------------------------------
// QueryExpanderConfig / ExpansionResult
// ---------------------------------------------------------------------------

std::map<std::string, std::string> QueryExpanderConfig::defaultAcronyms() {
    return {
        {"ai", "artificial intelligence"},
        {"ml", "machine learning"},
        {"dl", "deep learning"},
        {"nlp", "natural language processing"},
        {"llm", "large language model"},
        {"rag", "retrieval augmented generation"},
        {"api", "application programming interface"},
        {"db", "database"},
        {"sql", "structured query language"},
        {"ui", "user interface"},
        {"cpu", "central processing unit"},
        {"gpu", "graphics processing unit"},
        {"os", "operating system"},
        {"http", "hypertext transfer protocol"},
        {"json", "javascript object notation"},
    };
}

std::vector<std::string> ExpansionResult::allTerms() const {
    std::vector<std::string> out = originalTerms;
    out.insert(out.end(), expansionTerms.begin(), expansionTerms.end());
    return out;
}

// ---------------------------------------------------------------------------
// QueryExpander
// ---------------------------------------------------------------------------

QueryExpander::QueryExpander(QueryExpanderConfig config,
                             std::shared_ptr<const ISynonymSource> synonyms)
    : config_(std::move(config)), synonyms_(std::move(synonyms)) {
    if (!synonyms_ && config_.useSynonyms) {
        synonyms_ = std::make_shared<StaticSynonymSource>();
    }
    for (const auto& [abbr, full] : config_.acronyms) {
        acronyms_[toLower(abbr)] = toLower(full);
    }
    if (config_.maxExpansionFactor < 1.0) {
        config_.maxExpansionFactor = 1.0;
    }
}

std::string QueryExpander::normalize(const std::string& query) {
    std::istringstream iss(toLower(query));
    std::string word;
    std::string out;
    while (iss >> word) {
        if (!out.empty())
            out += ' ';
        out += word;
    }
    return out;
}

std::vector<std::string> QueryExpander::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream iss(toLower(text));
    std::string token;
    while (iss >> token) {
        while (!token.empty() && !std::isalnum(static_cast<unsigned char>(token.front()))) {
            token.erase(token.begin());
        }
        while (!token.empty() && !std::isalnum(static_cast<unsigned char>(token.back()))) {
            token.pop_back();
        }
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

bool QueryExpander::isStopword(const std::string& word) {
    return stopwords().count(word) > 0;
}

bool QueryExpander::compatible(PartOfSpeech a, PartOfSpeech b) {
    return a == PartOfSpeech::Unknown || b == PartOfSpeech::Unknown || a == b;
}

ExpansionResult QueryExpander::expandDetailed(const std::string& query) const {
    ExpansionResult result;
    result.originalQuery = query;

    auto tokens = tokenize(query);
    std::unordered_set<std::string> seen;
    for (const auto& t : tokens) {
        if (!isStopword(t) && seen.insert(t).second) {
            result.originalTerms.push_back(t);
        }
    }
    if (result.originalTerms.empty()) {
        // Nothing but stopwords; search for them rather than for nothing
        for (const auto& t : tokens) {
            if (seen.insert(t).second)
                result.originalTerms.push_back(t);
        }
    }

    if (!config_.enabled || result.originalTerms.empty()) {
        result.expandedQuery = query;
        return result;
    }

    const size_t budget = static_cast<size_t>(
        std::floor(config_.maxExpansionFactor * static_cast<double>(result.originalTerms.size())));
    auto hasRoom = [&]() {
        return result.originalTerms.size() + result.expansionTerms.size() < budget;
    };
    auto add = [&](const std::string& term) {
        if (hasRoom() && seen.insert(term).second) {
            result.expansionTerms.push_back(term);
        }
    };

    for (const auto& term : result.originalTerms) {
        if (!hasRoom())
            break;

        if (config_.useAcronyms) {
            auto it = acronyms_.find(term);
            if (it != acronyms_.end()) {
                result.acronymExpansions[term] = it->second;
                for (const auto& word : tokenize(it->second)) {
                    if (!isStopword(word))
                        add(word);
                }
            }
        }

        if (config_.useSynonyms && synonyms_) {
            auto entry = synonyms_->lookup(term);
            if (!entry)
                continue;
            std::vector<RelatedTerm> candidates;
            for (const auto& rel : entry->related) {
                if (rel.frequency < config_.minFrequency)
                    continue;
                if (!compatible(entry->pos, rel.pos))
                    continue;
                candidates.push_back(rel);
            }
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const RelatedTerm& a, const RelatedTerm& b) {
                                 if (a.frequency != b.frequency)
                                     return a.frequency > b.frequency;
                                 return a.term < b.term;
                             });
            size_t taken = 0;
            for (const auto& rel : candidates) {
                if (taken >= config_.maxSynonymsPerTerm)
                    break;
                auto normalized = normalize(rel.term);
                if (normalized.empty())
                    continue;
                size_t before = result.expansionTerms.size();
                add(normalized);
                if (result.expansionTerms.size() > before)
                    ++taken;
            }
        }
    }

    std::string expanded;
    for (const auto& t : result.allTerms()) {
        if (!expanded.empty())
            expanded += ' ';
        expanded += t;
    }
    result.expandedQuery = std::move(expanded);
    return result;
}

std::vector<std::string> QueryExpander::expand(const std::string& query) const {
    return expandDetailed(query).allTerms();
}

std::string QueryExpander::toOrQuery(const std::string& query) const {
    auto result = expandDetailed(query);
    if (result.expansionTerms.empty())
        return query;

    std::string out = query;
    for (const auto& t : result.expansionTerms) {
        out += " OR ";
        out += t;
    }
    return out;
}

QueryExpander::Stats QueryExpander::stats() const {
    Stats s;
    s.enabled = config_.enabled;
    s.useSynonyms = config_.useSynonyms;
    s.useAcronyms = config_.useAcronyms;
    s.maxExpansionFactor = config_.maxExpansionFactor;
    s.acronymCount = acronyms_.size();
    s.synonymSourceAvailable = synonyms_ != nullptr;
    return s;
}

} // namespace sieve::search
