#include <gtest/gtest.h>
#include "runtime/host.hh"

namespace eureka {
namespace {

InitAccount make_account() {
    AccountData data;
    data.reward_amount = 3;
    data.public_key_pem = "evaluator-key";
    return InitAccount{{{"p1", 0}, {"p2", 0}}, data.serialize()};
}

CustomEvent submit_from(const identity_t& sender, bytes_t ciphertext) {
    return CustomEvent{sender, encode_game_event(SubmitEvent{std::move(ciphertext)})};
}

CustomEvent evaluate_from(const identity_t& sender, Message message) {
    return CustomEvent{sender, encode_game_event(EvaluateEvent{std::move(message)})};
}

class SessionHostTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.evaluator_identity = "evaluator";
        config_.max_pending_submissions = 2;
        timeouts_ = std::make_shared<RecordingTimeoutPolicy>();

        auto opened = SessionHost::open(config_, make_account(), timeouts_);
        ASSERT_TRUE(opened.ok());
        host_ = std::move(opened.host);
    }

    GameConfig config_;
    std::shared_ptr<RecordingTimeoutPolicy> timeouts_;
    std::unique_ptr<SessionHost> host_;
};

TEST(SessionHostOpenTest, InvalidConfig) {
    GameConfig config;
    config.action_timeout_ms = 0;
    auto opened = SessionHost::open(config, make_account(), std::make_shared<RecordingTimeoutPolicy>());
    EXPECT_EQ(opened.error, ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(opened.host, nullptr);
}

TEST(SessionHostOpenTest, MissingTimeoutPolicy) {
    auto opened = SessionHost::open(GameConfig{}, make_account(), nullptr);
    EXPECT_EQ(opened.error, ErrorCode::INVALID_CONFIG);
}

TEST(SessionHostOpenTest, UndecodableAccount) {
    InitAccount account{{}, bytes_t{0xde, 0xad}};
    auto opened = SessionHost::open(GameConfig{}, account, std::make_shared<RecordingTimeoutPolicy>());
    EXPECT_EQ(opened.error, ErrorCode::DECODE_ERROR);
    EXPECT_EQ(opened.host, nullptr);
}

TEST_F(SessionHostTest, SubmitAndEvaluate) {
    EXPECT_EQ(host_->deliver(submit_from("p1", {1})), ErrorCode::OK);
    EXPECT_EQ(host_->deliver(evaluate_from("evaluator", Message{"p1", "x"})), ErrorCode::OK);

    auto snapshot = host_->snapshot();
    EXPECT_EQ(snapshot.participants().find("p1")->balance, 3u);
    EXPECT_EQ(snapshot.ledger().size(), 1u);
    EXPECT_EQ(timeouts_->armed().size(), 1u);
    EXPECT_EQ(host_->delivered(), 2u);
    EXPECT_EQ(host_->rejected(), 0u);
}

TEST_F(SessionHostTest, EvaluateFromOtherCallerIsUnauthorized) {
    ASSERT_EQ(host_->deliver(submit_from("p1", {1})), ErrorCode::OK);
    EXPECT_EQ(host_->deliver(evaluate_from("p1", Message{"p1", "x"})), ErrorCode::UNAUTHORIZED);

    auto snapshot = host_->snapshot();
    EXPECT_EQ(snapshot.pending().size(), 1u);
    EXPECT_TRUE(snapshot.ledger().empty());
    EXPECT_EQ(host_->rejected(), 1u);
}

TEST_F(SessionHostTest, RejectIsEvaluatorOnly) {
    ASSERT_EQ(host_->deliver(submit_from("p1", {1})), ErrorCode::OK);
    ASSERT_EQ(host_->deliver(submit_from("p2", {2})), ErrorCode::OK);
    auto reject = encode_game_event(RejectEvent{ErrorCode::CRYPTO_ERROR});

    EXPECT_EQ(host_->deliver(CustomEvent{"p2", reject}), ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(host_->snapshot().pending().size(), 2u);

    EXPECT_EQ(host_->deliver(CustomEvent{"evaluator", reject}), ErrorCode::OK);
    auto snapshot = host_->snapshot();
    ASSERT_EQ(snapshot.pending().size(), 1u);
    EXPECT_EQ(*snapshot.pending().front(), (bytes_t{2}));
}

TEST_F(SessionHostTest, ForgedClaimantFreesQueueSlot) {
    ASSERT_EQ(host_->deliver(submit_from("p1", {1})), ErrorCode::OK);
    ASSERT_EQ(host_->deliver(submit_from("p2", {2})), ErrorCode::OK);

    EXPECT_EQ(host_->deliver(evaluate_from("evaluator", Message{"ghost", "x"})),
              ErrorCode::UNKNOWN_PARTICIPANT);
    auto snapshot = host_->snapshot();
    EXPECT_EQ(snapshot.pending().size(), 1u);
    EXPECT_TRUE(snapshot.ledger().empty());
    EXPECT_EQ(host_->deliver(submit_from("p1", {3})), ErrorCode::OK);
}

TEST_F(SessionHostTest, PendingBoundIsEnforced) {
    EXPECT_EQ(host_->deliver(submit_from("p1", {1})), ErrorCode::OK);
    EXPECT_EQ(host_->deliver(submit_from("p2", {2})), ErrorCode::OK);
    EXPECT_EQ(host_->deliver(submit_from("p1", {3})), ErrorCode::QUEUE_FULL);
    EXPECT_EQ(host_->snapshot().pending().size(), 2u);

    // Room frees up once the evaluator consumes
    ASSERT_EQ(host_->deliver(evaluate_from("evaluator", Message{"p1", "x"})), ErrorCode::OK);
    EXPECT_EQ(host_->deliver(submit_from("p1", {3})), ErrorCode::OK);
}

TEST_F(SessionHostTest, MalformedPayloadIsDecodeError) {
    EXPECT_EQ(host_->deliver(CustomEvent{"p1", {0x09}}), ErrorCode::DECODE_ERROR);
    EXPECT_EQ(host_->delivered(), 1u);
    EXPECT_EQ(host_->rejected(), 1u);
}

TEST_F(SessionHostTest, UnknownSubmitterIsRejected) {
    EXPECT_EQ(host_->deliver(submit_from("ghost", {1})), ErrorCode::UNKNOWN_PARTICIPANT);
    EXPECT_TRUE(host_->snapshot().pending().empty());
}

TEST_F(SessionHostTest, SyncAndGameStartPassThrough) {
    EXPECT_EQ(host_->deliver(SyncEvent{{{"p3", 0}}}), ErrorCode::OK);
    EXPECT_EQ(host_->deliver(GameStartEvent{}), ErrorCode::OK);
    EXPECT_EQ(host_->deliver(submit_from("p3", {1})), ErrorCode::OK);
    EXPECT_EQ(host_->snapshot().participants().size(), 3u);
}

TEST_F(SessionHostTest, SnapshotIsDetached) {
    auto before = host_->snapshot();
    ASSERT_EQ(host_->deliver(submit_from("p1", {1})), ErrorCode::OK);
    EXPECT_TRUE(before.pending().empty());
    EXPECT_EQ(host_->snapshot().pending().size(), 1u);
}

TEST(SessionHostOpenTest, OpenEvaluatorTrustsEveryCaller) {
    auto timeouts = std::make_shared<RecordingTimeoutPolicy>();
    auto opened = SessionHost::open(GameConfig{}, make_account(), timeouts);
    ASSERT_TRUE(opened.ok());
    EXPECT_EQ(opened.host->deliver(evaluate_from("anyone", Message{"p2", "y"})), ErrorCode::OK);
    EXPECT_EQ(opened.host->snapshot().participants().find("p2")->balance, 3u);
}

}  // namespace
}  // namespace eureka
