#include <gtest/gtest.h>
#include "crypto/commit_reveal.hpp"

using namespace farmtrace::crypto;

class CommitRevealTest : public ::testing::Test {
protected:
  CommitRevealCodec codec;
  const std::string payload = R"({"batch_id":"B1","quality_score":91.5})";
};

TEST_F(CommitRevealTest, CommitStructure) {
  CommitRevealPair pair = codec.commit(payload);
  EXPECT_EQ(pair.reveal_hash, general_hash(payload));
  EXPECT_EQ(pair.commit_hash, general_hash(pair.reveal_hash.text + pair.nonce));
  EXPECT_FALSE(pair.nonce.empty());
}

TEST_F(CommitRevealTest, VerifyAcceptsOriginal) {
  CommitRevealPair pair = codec.commit(payload);
  EXPECT_TRUE(codec.verify(pair, payload));
}

TEST_F(CommitRevealTest, VerifyRejectsMutatedPayload) {
  CommitRevealPair pair = codec.commit(payload);
  EXPECT_FALSE(codec.verify(pair, R"({"batch_id":"B1","quality_score":91.6})"));
}

TEST_F(CommitRevealTest, VerifyRejectsWrongNonce) {
  CommitRevealPair pair = codec.commit(payload);
  pair.nonce += "0";
  EXPECT_FALSE(codec.verify(pair, payload));
}

TEST_F(CommitRevealTest, FreshNoncePerCommit) {
  CommitRevealPair first = codec.commit(payload);
  CommitRevealPair second = codec.commit(payload);
  EXPECT_EQ(first.reveal_hash, second.reveal_hash);
  EXPECT_NE(first.nonce, second.nonce);
  EXPECT_NE(first.commit_hash, second.commit_hash);
}

TEST_F(CommitRevealTest, SolidityFamily) {
  CommitRevealCodec solidity(HashFamily::Solidity);
  CommitRevealPair pair = solidity.commit(payload);
  EXPECT_EQ(pair.reveal_hash, solidity_hash(payload));
  EXPECT_TRUE(solidity.verify(pair, payload));
  EXPECT_FALSE(codec.verify(pair, payload));
}
