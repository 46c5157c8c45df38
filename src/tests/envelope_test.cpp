#include <gtest/gtest.h>
#include <stdexcept>
#include "record/envelope.hpp"
#include "record/payloads.hpp"
#include "test_utils.hpp"

using namespace farmtrace;
using namespace farmtrace::record;

class EnvelopeTest : public ::testing::Test {
protected:
  RecordEnvelope<WarehouseUpdate> envelope{test::sample_warehouse(), test::fixed_time()};
};

TEST_F(EnvelopeTest, StartsUnbound) {
  EXPECT_FALSE(envelope.content_address());
  EXPECT_EQ(envelope.find_digest("state_hash"), nullptr);
  EXPECT_EQ(envelope.created_at(), test::fixed_time());
  EXPECT_EQ(envelope.payload().warehouse_id, "WH-7");
}

TEST_F(EnvelopeTest, BindsContentAddressOnce) {
  envelope.bind_content_address("cid-1");
  ASSERT_TRUE(envelope.content_address());
  EXPECT_EQ(*envelope.content_address(), "cid-1");
  EXPECT_THROW(envelope.bind_content_address("cid-2"), std::logic_error);
  EXPECT_EQ(*envelope.content_address(), "cid-1");
}

TEST_F(EnvelopeTest, DigestsAndIdentifiers) {
  envelope.set_digest("state_hash", crypto::solidity_hash("x"));
  envelope.set_identifier("warehouse_id", "WH-7");

  ASSERT_NE(envelope.find_digest("state_hash"), nullptr);
  EXPECT_EQ(envelope.digest("state_hash"), crypto::solidity_hash("x"));
  EXPECT_EQ(envelope.identifier("warehouse_id"), "WH-7");
  EXPECT_THROW(envelope.digest("missing"), std::out_of_range);
  EXPECT_THROW(envelope.identifier("missing"), std::out_of_range);
  EXPECT_THROW(envelope.digests("missing"), std::out_of_range);
}

TEST_F(EnvelopeTest, CommitmentIsOptional) {
  EXPECT_FALSE(envelope.commitment());
  crypto::CommitRevealCodec codec;
  envelope.set_commitment(codec.commit("payload"));
  EXPECT_TRUE(envelope.commitment());
}
