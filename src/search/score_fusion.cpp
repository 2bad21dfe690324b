#include <sieve/search/score_fusion.h>

#include <algorithm>
#include <limits>
#include <string>
#include <unordered_map>

namespace sieve::search {

namespace {

struct Accumulator {
    SearchCandidate candidate;
    bool inVector = false;
};

// Collapses each list to one entry per docId, keeping its best (first) position.
std::vector<std::pair<const BackendCandidate*, size_t>>
bestPositions(const std::vector<BackendCandidate>& list) {
    std::vector<std::pair<const BackendCandidate*, size_t>> out;
    std::unordered_map<std::string, size_t> seen;
    for (size_t i = 0; i < list.size(); ++i) {
        if (seen.emplace(list[i].docId, i).second) {
            out.emplace_back(&list[i], i + 1);
        }
    }
    return out;
}

std::vector<SearchCandidate> sortAndRank(std::unordered_map<std::string, Accumulator>& acc) {
    std::vector<SearchCandidate> out;
    out.reserve(acc.size());
    for (auto& [id, a] : acc) {
        a.candidate.finalScore = a.candidate.fusedScore;
        out.push_back(std::move(a.candidate));
    }
    std::sort(out.begin(), out.end(), fusion::fusedBefore);
    assignRanks(out);
    return out;
}

} // namespace

namespace fusion {

double rrfContribution(size_t rank, double k) {
    return 1.0 / (k + static_cast<double>(rank));
}

std::vector<double> normalizeScores(const std::vector<double>& scores) {
    if (scores.empty())
        return {};
    auto [minIt, maxIt] = std::minmax_element(scores.begin(), scores.end());
    double lo = *minIt;
    double hi = *maxIt;
    if (hi == lo)
        return std::vector<double>(scores.size(), 1.0);
    std::vector<double> out;
    out.reserve(scores.size());
    for (double s : scores)
        out.push_back((s - lo) / (hi - lo));
    return out;
}

bool fusedBefore(const SearchCandidate& a, const SearchCandidate& b) {
    if (a.fusedScore != b.fusedScore)
        return a.fusedScore > b.fusedScore;
    const double lowest = -std::numeric_limits<double>::infinity();
    double av = a.vectorScore.value_or(lowest);
    double bv = b.vectorScore.value_or(lowest);
    if (av != bv)
        return av > bv;
    return a.docId < b.docId;
}

} // namespace fusion

ScoreFusion::ScoreFusion(ScoreFusionConfig config) : config_(config) {}

std::vector<SearchCandidate>
ScoreFusion::fuse(const std::vector<BackendCandidate>& vectorResults,
                  const std::vector<BackendCandidate>& keywordResults) const {
    switch (config_.strategy) {
        case FusionStrategy::LinearCombination:
            return linearCombination(vectorResults, keywordResults, config_.vectorWeight);
        case FusionStrategy::ReciprocalRank:
            break;
    }
    return reciprocalRankFusion(vectorResults, keywordResults, config_.rrfK);
}

std::vector<SearchCandidate>
ScoreFusion::reciprocalRankFusion(const std::vector<BackendCandidate>& vectorResults,
                                  const std::vector<BackendCandidate>& keywordResults, double k) {
    std::unordered_map<std::string, Accumulator> acc;

    for (const auto& [bc, rank] : bestPositions(vectorResults)) {
        auto& a = acc[bc->docId];
        a.candidate.docId = bc->docId;
        a.candidate.contentRef = bc->content;
        a.candidate.metadata = bc->metadata;
        a.candidate.vectorScore = bc->score;
        a.candidate.fusedScore += fusion::rrfContribution(rank, k);
        a.inVector = true;
    }
    for (const auto& [bc, rank] : bestPositions(keywordResults)) {
        auto& a = acc[bc->docId];
        if (!a.inVector) {
            a.candidate.docId = bc->docId;
            a.candidate.contentRef = bc->content;
            a.candidate.metadata = bc->metadata;
        } else if (a.candidate.contentRef.empty()) {
            a.candidate.contentRef = bc->content;
        }
        a.candidate.keywordScore = bc->score;
        a.candidate.fusedScore += fusion::rrfContribution(rank, k);
    }
    return sortAndRank(acc);
}

std::vector<SearchCandidate>
ScoreFusion::linearCombination(const std::vector<BackendCandidate>& vectorResults,
                               const std::vector<BackendCandidate>& keywordResults,
                               double vectorWeight) {
    auto vecBest = bestPositions(vectorResults);
    auto kwBest = bestPositions(keywordResults);

    std::vector<double> vecScores;
    for (const auto& [bc, rank] : vecBest)
        vecScores.push_back(bc->score);
    std::vector<double> kwScores;
    for (const auto& [bc, rank] : kwBest)
        kwScores.push_back(bc->score);
    auto vecNorm = fusion::normalizeScores(vecScores);
    auto kwNorm = fusion::normalizeScores(kwScores);

    const double alpha = std::clamp(vectorWeight, 0.0, 1.0);
    std::unordered_map<std::string, Accumulator> acc;

    for (size_t i = 0; i < vecBest.size(); ++i) {
        const auto* bc = vecBest[i].first;
        auto& a = acc[bc->docId];
        a.candidate.docId = bc->docId;
        a.candidate.contentRef = bc->content;
        a.candidate.metadata = bc->metadata;
        a.candidate.vectorScore = bc->score;
        a.candidate.fusedScore += alpha * vecNorm[i];
        a.inVector = true;
    }
    for (size_t i = 0; i < kwBest.size(); ++i) {
        const auto* bc = kwBest[i].first;
        auto& a = acc[bc->docId];
        if (!a.inVector) {
            a.candidate.docId = bc->docId;
            a.candidate.contentRef = bc->content;
            a.candidate.metadata = bc->metadata;
        }
        a.candidate.keywordScore = bc->score;
        a.candidate.fusedScore += (1.0 - alpha) * kwNorm[i];
    }
    return sortAndRank(acc);
}

} // namespace sieve::search
