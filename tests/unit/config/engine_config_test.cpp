#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <sieve/config/engine_config.h>

#include "support/temp_dir_scope.hpp"

using namespace sieve;
using namespace sieve::config;
using namespace std::chrono_literals;

class EngineConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"SIEVE_ENGINE_WORKER_THREADS", "SIEVE_RETRY_MAX_ATTEMPTS",
                                 "SIEVE_FUSION_STRATEGY", "SIEVE_CACHE_CAPACITY"}) {
            ::unsetenv(name);
        }
    }

    std::filesystem::path writeConfig(const std::string& body) {
        auto path = dir_.path() / "config.toml";
        std::ofstream out(path);
        out << body;
        return path;
    }

    test_support::TempDirScope dir_{"sieve-engine-config"};
};

TEST_F(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.cache.capacity, 100u);
    EXPECT_EQ(config.vectorBreaker.failureThreshold, 5u);
    EXPECT_EQ(config.vectorBreaker.recoveryTimeout, 30s);
    EXPECT_EQ(config.retry.maxAttempts, 3u);
    EXPECT_DOUBLE_EQ(config.fusion.rrfK, 60.0);
    EXPECT_DOUBLE_EQ(config.semanticCache.similarityThreshold, 0.85);
    EXPECT_FALSE(config.defaultDiversityLambda.has_value());
}

TEST_F(EngineConfigTest, MissingFileMeansDefaults) {
    auto config = load_engine_config(dir_.path() / "absent.toml");
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config.value().workerThreads, 4u);
}

TEST_F(EngineConfigTest, FileValuesAreApplied) {
    auto path = writeConfig(R"([engine]
worker_threads = 2
default_limit = 5
diversity_lambda = 0.3
backend_timeout_ms = 750

[cache]
capacity = 250
ttl_seconds = 120

[circuit_breaker]
failure_threshold = 3
recovery_timeout_ms = 1000

[fusion]
strategy = linear
vector_weight = 0.6

[expansion]
enabled = false
)");
    auto loaded = load_engine_config(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto& c = loaded.value();
    EXPECT_EQ(c.workerThreads, 2u);
    EXPECT_EQ(c.defaultResultLimit, 5u);
    ASSERT_TRUE(c.defaultDiversityLambda.has_value());
    EXPECT_DOUBLE_EQ(*c.defaultDiversityLambda, 0.3);
    EXPECT_EQ(c.backendTimeout, 750ms);
    EXPECT_EQ(c.cache.capacity, 250u);
    EXPECT_EQ(c.cache.ttl, 120s);
    EXPECT_EQ(c.vectorBreaker.failureThreshold, 3u);
    EXPECT_EQ(c.vectorBreaker.recoveryTimeout, 1000ms);
    EXPECT_EQ(c.embeddingBreaker.failureThreshold, 5u);
    EXPECT_EQ(c.fusion.strategy, search::FusionStrategy::LinearCombination);
    EXPECT_DOUBLE_EQ(c.fusion.vectorWeight, 0.6);
    EXPECT_FALSE(c.expansion.enabled);
}

TEST_F(EngineConfigTest, UnknownKeysAreIgnored) {
    EngineConfig config;
    ConfigTable table{{"engine", {{"no_such_key", "1"}}}, {"mystery", {{"x", "y"}}}};
    EXPECT_TRUE(apply_config_table(config, table));
    EXPECT_EQ(config.workerThreads, 4u);
}

TEST_F(EngineConfigTest, BadValueNamesTheKey) {
    EngineConfig config;
    ConfigTable table{{"retry", {{"max_attempts", "three"}}}};
    auto r = apply_config_table(config, table);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(r.error().message.find("retry.max_attempts"), std::string::npos);
}

TEST_F(EngineConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig("[engine]\nworker_threads = 2\n");
    ::setenv("SIEVE_ENGINE_WORKER_THREADS", "6", 1);
    ::setenv("SIEVE_RETRY_MAX_ATTEMPTS", "4", 1);

    auto loaded = load_engine_config(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded.value().workerThreads, 6u);
    EXPECT_EQ(loaded.value().retry.maxAttempts, 4u);
}

TEST_F(EngineConfigTest, InvalidEnvironmentValueFails) {
    ::setenv("SIEVE_FUSION_STRATEGY", "borda", 1);
    auto loaded = load_engine_config({});
    ASSERT_FALSE(loaded);
    EXPECT_NE(loaded.error().message.find("SIEVE_FUSION_STRATEGY"), std::string::npos);
}

TEST_F(EngineConfigTest, ValidationRejectsOutOfRangeValues) {
    ::setenv("SIEVE_CACHE_CAPACITY", "0", 1);
    auto loaded = load_engine_config({});
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidArgument);
    ::unsetenv("SIEVE_CACHE_CAPACITY");

    EngineConfig config;
    config.defaultDiversityLambda = 1.5;
    EXPECT_FALSE(config.validate());

    config = EngineConfig{};
    config.defaultResultLimit = 500;
    EXPECT_FALSE(config.validate());

    config = EngineConfig{};
    config.retry.multiplier = 0.5;
    EXPECT_FALSE(config.validate());

    config = EngineConfig{};
    config.fusion.rrfK = 0.0;
    EXPECT_FALSE(config.validate());

    config = EngineConfig{};
    config.backendTimeout = config.requestTimeout + std::chrono::milliseconds(1);
    EXPECT_FALSE(config.validate());
}

TEST_F(EngineConfigTest, LogLevel) {
    auto before = spdlog::get_level();
    EXPECT_TRUE(apply_log_level("debug"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_TRUE(apply_log_level("off"));
    EXPECT_FALSE(apply_log_level("chatty"));
    spdlog::set_level(before);
}
