#include <gtest/gtest.h>
#include "crypto/hash.hh"
#include "game/result_ledger.hh"

using namespace eureka;

// ============================================================================
// Key Derivation Tests
// ============================================================================

TEST(ResultKeyTest, DigestPolicyHashesContent) {
    EXPECT_EQ(derive_result_key("Solution10", ResultKeyPolicy::DIGEST), sha3_256_hex("Solution10"));
}

TEST(ResultKeyTest, VerbatimPolicyKeepsContent) {
    EXPECT_EQ(derive_result_key("Solution10", ResultKeyPolicy::VERBATIM), "Solution10");
}

TEST(ResultKeyTest, PoliciesAgreeOnPredigestedContent) {
    auto digest = sha3_256_hex("Solution10");
    EXPECT_EQ(derive_result_key(digest, ResultKeyPolicy::VERBATIM),
              derive_result_key("Solution10", ResultKeyPolicy::DIGEST));
}

// ============================================================================
// ResultLedger Tests
// ============================================================================

TEST(ResultLedgerTest, InsertOnlyFirstClaimWins) {
    ResultLedger ledger;
    EXPECT_EQ(ledger.insert("k1", "player1"), ResultLedger::InsertResult::INSERTED);
    EXPECT_EQ(ledger.insert("k1", "player2"), ResultLedger::InsertResult::DUPLICATE);

    EXPECT_EQ(ledger.size(), 1u);
    EXPECT_EQ(ledger.claimant("k1"), "player1");
    EXPECT_FALSE(ledger.claimant("k2").has_value());
}

TEST(ResultLedgerTest, SerializeDeserialize) {
    ResultLedger ledger;
    ledger.insert("k2", "player2");
    ledger.insert("k1", "player1");

    auto bytes = ledger.serialize();
    ByteReader reader(bytes);
    auto decoded = ResultLedger::deserialize(reader);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, ledger);
    EXPECT_TRUE(reader.at_end());
}

TEST(ResultLedgerTest, EmptyLedgerEncodesAsZeroCount) {
    ResultLedger ledger;
    EXPECT_EQ(ledger.serialize(), (bytes_t{0, 0, 0, 0}));
}

TEST(ResultLedgerTest, RejectsDuplicateKeysOnDecode) {
    bytes_t bytes;
    append_u32(bytes, 2);
    append_string(bytes, "k1");
    append_string(bytes, "a");
    append_string(bytes, "k1");
    append_string(bytes, "b");

    ByteReader reader(bytes);
    EXPECT_FALSE(ResultLedger::deserialize(reader).has_value());
}

TEST(ResultLedgerTest, RejectsTruncatedEntries) {
    bytes_t bytes;
    append_u32(bytes, 2);
    append_string(bytes, "k1");
    append_string(bytes, "a");

    ByteReader reader(bytes);
    EXPECT_FALSE(ResultLedger::deserialize(reader).has_value());
}

TEST(ResultLedgerTest, FingerprintTracksContents) {
    ResultLedger a;
    ResultLedger b;
    EXPECT_EQ(a.fingerprint(), b.fingerprint());

    a.insert("k1", "player1");
    EXPECT_NE(a.fingerprint(), b.fingerprint());

    b.insert("k1", "player1");
    EXPECT_EQ(a.fingerprint(), b.fingerprint());
}
