#include <gtest/gtest.h>
#include <set>
#include "crypto/entropy.hpp"
#include "crypto/hasher.hpp"
#include "crypto/keccak.hpp"

using namespace farmtrace::crypto;

TEST(HasherTest, SolidityHashKnownVectors) {
  EXPECT_EQ(solidity_hash("").text,
            "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  EXPECT_EQ(solidity_hash("abc").text,
            "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(HasherTest, GeneralHashKnownVectors) {
  EXPECT_EQ(general_hash("").text,
            "0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(general_hash("abc").text,
            "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HasherTest, DigestCarriesFamily) {
  EXPECT_EQ(hash(HashFamily::Solidity, "abc").family, HashFamily::Solidity);
  EXPECT_EQ(hash(HashFamily::General, "abc").family, HashFamily::General);
  EXPECT_NE(solidity_hash("abc"), general_hash("abc"));
}

TEST(HasherTest, DigestFormat) {
  Digest digest = solidity_hash("batch-1");
  ASSERT_EQ(digest.text.size(), 66u);
  EXPECT_EQ(digest.text.substr(0, 2), "0x");
  EXPECT_EQ(digest.text.find_first_not_of("0123456789abcdef", 2), std::string::npos);
}

TEST(HasherTest, KeccakIncrementalMatchesOneShot) {
  // Spans more than one 136-byte block
  std::string input(300, 'x');
  Keccak256 hasher;
  hasher.update(input.substr(0, 7));
  hasher.update(input.substr(7, 200));
  hasher.update(input.substr(207));
  EXPECT_EQ(hasher.finalize(), Keccak256::digest(input));
}

TEST(HasherTest, KeccakRateBoundary) {
  std::string exactly_rate(Keccak256::RATE, 'a');
  std::string one_less(Keccak256::RATE - 1, 'a');
  EXPECT_NE(Keccak256::digest(exactly_rate), Keccak256::digest(one_less));
}

TEST(EntropyTest, NonceIsHexAndUnique) {
  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) {
    std::string nonce = generate_nonce();
    EXPECT_FALSE(nonce.empty());
    EXPECT_TRUE(seen.insert(nonce).second) << "Duplicate nonce: " << nonce;
  }
}

TEST(EntropyTest, DidFormat) {
  std::string did = generate_did("farmer");
  ASSERT_EQ(did.rfind("did:farmer:", 0), 0u);
  std::string uuid = did.substr(std::string("did:farmer:").size());
  ASSERT_EQ(uuid.size(), 36u);
  EXPECT_EQ(uuid[8], '-');
  EXPECT_EQ(uuid[14], '4');
  EXPECT_NE(generate_did("farmer"), did);
}
