#include <gtest/gtest.h>
#include "core/config.hh"

using namespace eureka;

TEST(GameConfigTest, DefaultsAreValid) {
    GameConfig config;
    EXPECT_EQ(config.action_timeout_ms, 30000u);
    EXPECT_EQ(config.result_key_policy, ResultKeyPolicy::DIGEST);
    EXPECT_TRUE(config.evaluator_identity.empty());
    EXPECT_EQ(config.max_pending_submissions, 0u);
    EXPECT_FALSE(config.validate().has_value());
}

TEST(GameConfigTest, RejectsZeroTimeout) {
    GameConfig config;
    config.action_timeout_ms = 0;
    auto problem = config.validate();
    ASSERT_TRUE(problem.has_value());
    EXPECT_NE(problem->find("action_timeout_ms"), std::string::npos);
}

TEST(GameConfigTest, RejectsUnknownPolicy) {
    GameConfig config;
    config.result_key_policy = static_cast<ResultKeyPolicy>(7);
    EXPECT_TRUE(config.validate().has_value());
}

TEST(GameConfigTest, RejectsOversizedEvaluatorIdentity) {
    GameConfig config;
    config.evaluator_identity = std::string(MAX_IDENTITY_SIZE, 'e');
    EXPECT_FALSE(config.validate().has_value());

    config.evaluator_identity.push_back('e');
    EXPECT_TRUE(config.validate().has_value());
}

TEST(GameConfigTest, PolicyNames) {
    EXPECT_EQ(result_key_policy_name(ResultKeyPolicy::DIGEST), "digest");
    EXPECT_EQ(result_key_policy_name(ResultKeyPolicy::VERBATIM), "verbatim");
}
