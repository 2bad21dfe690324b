#include <cmath>
#include <memory>
#include <gtest/gtest.h>
#include <sieve/search/reranker.h>

#include "common/test_backends.h"

using namespace sieve;
using namespace sieve::search;
using namespace std::chrono_literals;

namespace {

SearchCandidate candidate(const std::string& id, double score, const std::string& content = "") {
    SearchCandidate c;
    c.docId = id;
    c.contentRef = content.empty() ? "content " + id : content;
    c.fusedScore = score;
    c.finalScore = score;
    return c;
}

std::vector<SearchCandidate> fusedList() {
    std::vector<SearchCandidate> list{candidate("a", 0.040), candidate("b", 0.035),
                                      candidate("c", 0.030), candidate("d", 0.025)};
    assignRanks(list);
    return list;
}

std::vector<std::string> ids(const std::vector<SearchCandidate>& list) {
    std::vector<std::string> out;
    for (const auto& c : list)
        out.push_back(c.docId);
    return out;
}

} // namespace

class RerankerTest : public ::testing::Test {
protected:
    void SetUp() override {
        encoder_ = std::make_shared<test::MockCrossEncoder>();
        RerankerConfig config;
        config.batchSize = 2;
        config.timeout = 1000ms;
        reranker_ = std::make_unique<Reranker>(encoder_, config);
    }

    std::shared_ptr<test::MockCrossEncoder> encoder_;
    std::unique_ptr<Reranker> reranker_;
};

TEST_F(RerankerTest, ReordersByCrossEncoderScore) {
    encoder_->setScore("content a", 0.2f);
    encoder_->setScore("content b", 0.9f);
    encoder_->setScore("content c", 0.5f);
    encoder_->setScore("content d", 0.1f);

    auto out = reranker_->rerank("query", fusedList(), 4);
    ASSERT_TRUE(out.applied);
    EXPECT_FALSE(out.failure.has_value());
    EXPECT_EQ(ids(out.results), (std::vector<std::string>{"b", "c", "a", "d"}));
    EXPECT_NEAR(*out.results[0].rerankScore, 0.9, 1e-6);
    EXPECT_NEAR(out.results[0].finalScore, 0.9, 1e-6);
    EXPECT_TRUE(isWellRanked(out.results));
    // fused scores are carried through untouched
    EXPECT_DOUBLE_EQ(out.results[0].fusedScore, 0.035);
}

TEST_F(RerankerTest, OnlyTopKIsRescored) {
    encoder_->setScore("content a", 0.1f);
    encoder_->setScore("content b", 0.8f);

    auto out = reranker_->rerank("query", fusedList(), 2);
    ASSERT_TRUE(out.applied);
    EXPECT_EQ(ids(out.results), (std::vector<std::string>{"b", "a", "c", "d"}));
    EXPECT_FALSE(out.results[2].rerankScore.has_value());
    EXPECT_LE(out.results[2].finalScore, out.results[1].finalScore);
    EXPECT_TRUE(isWellRanked(out.results));
}

TEST_F(RerankerTest, TailIsScaledBelowLowModelScores) {
    encoder_->setScore("content a", 0.004f);
    encoder_->setScore("content b", 0.008f);

    auto out = reranker_->rerank("query", fusedList(), 2);
    ASSERT_TRUE(out.applied);
    EXPECT_EQ(ids(out.results), (std::vector<std::string>{"b", "a", "c", "d"}));
    EXPECT_NEAR(out.results[2].finalScore, 0.004, 1e-6);
    EXPECT_NEAR(out.results[3].finalScore, 0.004 * 0.025 / 0.030, 1e-6);
    // tail keeps its spread instead of flattening onto the last model score
    EXPECT_LT(out.results[3].finalScore, out.results[2].finalScore);
    EXPECT_DOUBLE_EQ(out.results[3].fusedScore, 0.025);
    EXPECT_TRUE(isWellRanked(out.results));
}

TEST_F(RerankerTest, ScoresAreBatched) {
    auto out = reranker_->rerank("query", fusedList(), 10);
    ASSERT_TRUE(out.applied);
    EXPECT_EQ(encoder_->calls(), 2);
}

TEST_F(RerankerTest, RawLogitsAreSquashed) {
    encoder_->setScore("content a", -1.0f);
    encoder_->setScore("content b", 2.0f);

    auto out = reranker_->rerank("query", fusedList(), 2);
    ASSERT_TRUE(out.applied);
    EXPECT_EQ(out.results[0].docId, "b");
    EXPECT_NEAR(*out.results[0].rerankScore, 1.0 / (1.0 + std::exp(-2.0)), 1e-6);
    EXPECT_NEAR(*out.results[1].rerankScore, 1.0 / (1.0 + std::exp(1.0)), 1e-6);
}

TEST_F(RerankerTest, TimeoutFallsBackToFusedOrder) {
    encoder_->setDelay(300ms);
    auto input = fusedList();
    auto out = reranker_->rerank("query", input, 4, 20ms);
    EXPECT_FALSE(out.applied);
    ASSERT_TRUE(out.failure.has_value());
    EXPECT_EQ(out.failure->code, ErrorCode::Timeout);
    EXPECT_EQ(out.results, input);
    EXPECT_EQ(reranker_->stats().timeouts, 1u);
    EXPECT_EQ(reranker_->stats().fallbacks, 1u);
}

TEST_F(RerankerTest, ModelErrorFallsBack) {
    encoder_->setFailing(true);
    auto out = reranker_->rerank("query", fusedList(), 4);
    EXPECT_FALSE(out.applied);
    EXPECT_EQ(out.failure->code, ErrorCode::InternalError);
    EXPECT_EQ(ids(out.results), (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST_F(RerankerTest, WrongScoreCountFallsBack) {
    encoder_->setDropLastScore(true);
    auto out = reranker_->rerank("query", fusedList(), 4);
    EXPECT_FALSE(out.applied);
    EXPECT_EQ(out.failure->code, ErrorCode::InvalidData);
}

TEST_F(RerankerTest, NotReadyModelIsSkipped) {
    encoder_->setReady(false);
    EXPECT_FALSE(reranker_->available());
    auto out = reranker_->rerank("query", fusedList(), 4);
    EXPECT_FALSE(out.applied);
    EXPECT_EQ(out.failure->code, ErrorCode::Unavailable);
    EXPECT_EQ(encoder_->calls(), 0);
}

TEST(RerankerWithoutModelTest, ReportsNotInitialized) {
    Reranker reranker(nullptr);
    EXPECT_FALSE(reranker.available());
    auto out = reranker.rerank("query", fusedList(), 4);
    EXPECT_FALSE(out.applied);
    EXPECT_EQ(out.failure->code, ErrorCode::NotInitialized);

    auto empty = reranker.rerank("query", {}, 4);
    EXPECT_FALSE(empty.failure.has_value());
    EXPECT_TRUE(empty.results.empty());
}

TEST_F(RerankerTest, DiversifyRejectsLambdaOutOfRange) {
    auto r = reranker_->diversify(fusedList(), 1.5);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(reranker_->diversify(fusedList(), -0.1));
}

TEST_F(RerankerTest, DiversifyEmptyInput) {
    auto r = reranker_->diversify({}, 0.5);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
}

TEST_F(RerankerTest, DiversifyWithLambdaOneKeepsRelevanceOrder) {
    auto r = reranker_->diversify(fusedList(), 1.0);
    ASSERT_TRUE(r);
    EXPECT_EQ(ids(r.value()), (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST_F(RerankerTest, DiversifyDemotesNearDuplicates) {
    std::vector<SearchCandidate> list{candidate("a", 1.0, "neural network training"),
                                      candidate("b", 0.9, "neural network training"),
                                      candidate("c", 0.8, "database index tuning")};
    auto r = reranker_->diversify(list, 0.5);
    ASSERT_TRUE(r);
    EXPECT_EQ(ids(r.value()), (std::vector<std::string>{"a", "c", "b"}));
    EXPECT_TRUE(isWellRanked(r.value()));
    EXPECT_EQ(reranker_->stats().diversifications, 1u);
}

TEST_F(RerankerTest, DiversifyHonoursLimit) {
    auto r = reranker_->diversify(fusedList(), 0.7, 2);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0].docId, "a");
}

TEST(RerankerJaccardTest, Similarity) {
    EXPECT_DOUBLE_EQ(Reranker::jaccardSimilarity({"a", "b"}, {"b", "c"}), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(Reranker::jaccardSimilarity({"a"}, {"a"}), 1.0);
    EXPECT_DOUBLE_EQ(Reranker::jaccardSimilarity({}, {}), 0.0);
}
