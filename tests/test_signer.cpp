#include <gtest/gtest.h>
#include "flowtx/core/signer.hpp"
#include "flowtx/core/errors.hpp"
#include <algorithm>

using namespace flowtx::core;

namespace {
  constexpr const char* kProposerKey = "1f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a7988";
  constexpr const char* kPayerKey = "c9afa9d845ba75166b5c215767b1d6934e50c3db36e89b127b8a622b120f6721";

  Transaction sample_transaction() {
    Bytes ref_block(32, 0x11);
    ProposalKey proposer{address_from_hex("01"), 0, 5};
    return build_transaction(to_bytes("transaction { execute {} }"), {}, ref_block, 9999, proposer,
                             {"01"}, "02");
  }

  SignerCredential credential(const std::string& address, uint32_t key_index, const char* key,
                              KeySpec spec = {}) {
    return SignerCredential{address, key_index, PrivateKey(key), spec};
  }
}

TEST(SignerDomainTag, PaddedToThirtyTwoBytes) {
  const auto& tag = transaction_domain_tag();
  ASSERT_EQ(tag.size(), kDomainTagSize);
  EXPECT_EQ(std::string(tag.begin(), tag.begin() + kTransactionDomainTag.size()), kTransactionDomainTag);
  for (size_t i = kTransactionDomainTag.size(); i < tag.size(); ++i) EXPECT_EQ(tag[i], 0x00);
}

TEST(SignerSignable, TagThenMessage) {
  auto transaction = sample_transaction();
  auto signable = payload_signable(transaction);
  auto payload = transaction.payload_message();
  ASSERT_EQ(signable.size(), kDomainTagSize + payload.size());
  EXPECT_TRUE(std::equal(payload.begin(), payload.end(), signable.begin() + kDomainTagSize));

  auto envelope = envelope_signable(transaction);
  auto envelope_message = transaction.envelope_message();
  EXPECT_TRUE(std::equal(envelope_message.begin(), envelope_message.end(), envelope.begin() + kDomainTagSize));
}

TEST(SignerPayload, OneSignaturePerSignerInOrder) {
  ASSERT_TRUE(crypto_init());
  std::vector<SignerCredential> signers;
  signers.push_back(credential("03", 7, kProposerKey));
  signers.push_back(credential("04", 2, kPayerKey));
  signers.push_back(credential("05", 5, kProposerKey));

  auto signed_tx = sign_payload(sample_transaction(), signers);
  EXPECT_EQ(signed_tx.signing_state, SigningState::PayloadSigned);
  ASSERT_EQ(signed_tx.payload_signatures.size(), 3u);
  EXPECT_EQ(to_hex(signed_tx.payload_signatures[0].address), "0000000000000003");
  EXPECT_EQ(signed_tx.payload_signatures[0].key_index, 7u);
  EXPECT_EQ(signed_tx.payload_signatures[1].key_index, 2u);
  EXPECT_EQ(signed_tx.payload_signatures[2].key_index, 5u);
  for (const auto& sig : signed_tx.payload_signatures) EXPECT_EQ(sig.signature.size(), 64u);

  // Envelope triples carry the position, not the key index.
  auto envelope = rlp::decode(signed_tx.envelope_message());
  const auto& triples = envelope.list()[1].list();
  ASSERT_EQ(triples.size(), 3u);
  for (size_t i = 0; i < triples.size(); ++i) {
    EXPECT_EQ(rlp::to_uint(triples[i].list()[0]), i);
    EXPECT_EQ(triples[i].list()[2].bytes(), signed_tx.payload_signatures[i].signature);
  }
  EXPECT_EQ(rlp::to_uint(triples[0].list()[1]), 7u);
  EXPECT_EQ(rlp::to_uint(triples[1].list()[1]), 2u);
  EXPECT_EQ(rlp::to_uint(triples[2].list()[1]), 5u);
}

TEST(SignerPayload, SignaturesVerifyAgainstPublicKeys) {
  ASSERT_TRUE(crypto_init());
  std::vector<SignerCredential> signers;
  signers.push_back(credential("01", 0, kProposerKey));
  auto signed_tx = sign_payload(sample_transaction(), signers);

  auto public_key = derive_public_key(PrivateKey(kProposerKey), SignatureAlgorithm::ECDSA_P256);
  auto other_key = derive_public_key(PrivateKey(kPayerKey), SignatureAlgorithm::ECDSA_P256);
  EXPECT_TRUE(verify_payload_signature(signed_tx, 0, public_key));
  EXPECT_FALSE(verify_payload_signature(signed_tx, 0, other_key));
  EXPECT_THROW(verify_payload_signature(signed_tx, 1, public_key), InvalidArgument);
}

TEST(SignerPayload, DeterministicForSameInputs) {
  ASSERT_TRUE(crypto_init());
  std::vector<SignerCredential> signers;
  signers.push_back(credential("01", 0, kProposerKey));
  auto first = sign_payload(sample_transaction(), signers);
  auto second = sign_payload(sample_transaction(), signers);
  EXPECT_EQ(first.payload_signatures[0].signature, second.payload_signatures[0].signature);
  EXPECT_EQ(first.envelope_message(), second.envelope_message());
}

TEST(SignerPayload, EmptySignerListStillAdvancesState) {
  auto signed_tx = sign_payload(sample_transaction(), {});
  EXPECT_TRUE(signed_tx.payload_signatures.empty());
  EXPECT_EQ(signed_tx.signing_state, SigningState::PayloadSigned);
}

TEST(SignerPayload, FailureLeavesInputUntouched) {
  ASSERT_TRUE(crypto_init());
  auto transaction = sample_transaction();

  std::vector<SignerCredential> bad_key;
  bad_key.push_back(credential("01", 0, kProposerKey));
  bad_key.push_back(credential("02", 0, "deadbeef"));
  EXPECT_THROW(sign_payload(transaction, bad_key), CryptoError);

  std::vector<SignerCredential> bad_address;
  bad_address.push_back(credential("01", 0, kProposerKey));
  bad_address.push_back(credential("0xnothex", 0, kPayerKey));
  EXPECT_THROW(sign_payload(transaction, bad_address), DecodeError);

  EXPECT_TRUE(transaction.payload_signatures.empty());
  EXPECT_EQ(transaction.signing_state, SigningState::Unsigned);
}

TEST(SignerPayload, RejectedAfterEnvelopeSigning) {
  ASSERT_TRUE(crypto_init());
  std::vector<SignerCredential> signers;
  signers.push_back(credential("02", 0, kPayerKey));
  auto fully_signed = sign_envelope(sample_transaction(), signers);
  EXPECT_EQ(fully_signed.signing_state, SigningState::FullySigned);
  EXPECT_THROW(sign_payload(fully_signed, signers), InvalidArgument);
}

TEST(SignerEnvelope, SingleAccountSignsBothStages) {
  ASSERT_TRUE(crypto_init());
  std::vector<SignerCredential> signers;
  signers.push_back(credential("01", 0, kProposerKey));

  auto transaction = sample_transaction();
  auto fully_signed = sign_transaction(transaction, signers, signers);
  EXPECT_EQ(fully_signed.signing_state, SigningState::FullySigned);
  ASSERT_EQ(fully_signed.payload_signatures.size(), 1u);
  ASSERT_EQ(fully_signed.envelope_signatures.size(), 1u);
  EXPECT_NE(fully_signed.payload_signatures[0].signature, fully_signed.envelope_signatures[0].signature);

  auto public_key = derive_public_key(PrivateKey(kProposerKey), SignatureAlgorithm::ECDSA_P256);
  EXPECT_TRUE(verify_payload_signature(fully_signed, 0, public_key));
  EXPECT_TRUE(verify_envelope_signature(fully_signed, 0, public_key));
}

TEST(SignerEnvelope, CoversPayloadSignatureOrder) {
  ASSERT_TRUE(crypto_init());
  std::vector<SignerCredential> forward;
  forward.push_back(credential("03", 1, kProposerKey));
  forward.push_back(credential("04", 2, kPayerKey));
  std::vector<SignerCredential> reverse;
  reverse.push_back(credential("04", 2, kPayerKey));
  reverse.push_back(credential("03", 1, kProposerKey));
  std::vector<SignerCredential> payer;
  payer.push_back(credential("02", 0, kPayerKey));

  auto a = sign_transaction(sample_transaction(), forward, payer);
  auto b = sign_transaction(sample_transaction(), reverse, payer);
  EXPECT_NE(a.envelope_message(), b.envelope_message());
  EXPECT_NE(a.envelope_signatures[0].signature, b.envelope_signatures[0].signature);
}

TEST(SignerEnvelope, HonoursKeySpecPerSigner) {
  ASSERT_TRUE(crypto_init());
  KeySpec k1_sha2{SignatureAlgorithm::ECDSA_secp256k1, HashAlgorithm::SHA2_256};
  std::vector<SignerCredential> signers;
  signers.push_back(credential("02", 1, kProposerKey, k1_sha2));

  auto fully_signed = sign_transaction(sample_transaction(), {}, signers);
  auto public_key = derive_public_key(PrivateKey(kProposerKey), SignatureAlgorithm::ECDSA_secp256k1);
  EXPECT_TRUE(verify_envelope_signature(fully_signed, 0, public_key, k1_sha2));
  EXPECT_FALSE(verify_envelope_signature(fully_signed, 0, public_key,
                                         KeySpec{SignatureAlgorithm::ECDSA_secp256k1, HashAlgorithm::SHA3_256}));
}
