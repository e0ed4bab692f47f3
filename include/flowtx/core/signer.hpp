#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <flowtx/core/keys.hpp>
#include <flowtx/core/transaction.hpp>

namespace flowtx::core {

  // Domain separation tag for transaction messages, right-padded to 32 bytes on use.
  inline constexpr std::string_view kTransactionDomainTag = "FLOW-V0.0-transaction";
  inline constexpr size_t kDomainTagSize = 32;

  const Bytes& transaction_domain_tag();

  // Exactly the bytes a payload / envelope signer signs: padded tag || RLP view.
  Bytes payload_signable(const Transaction& transaction);
  Bytes envelope_signable(const Transaction& transaction);

  /**
   * One account key able to sign. The address is decoded when the signature is
   * produced; the key is only borrowed for the duration of a signing call.
   */
  struct SignerCredential {
    std::string address;
    uint32_t key_index = 0;
    PrivateKey private_key;
    KeySpec key_spec{};
  };

  /**
   * Unsigned/PayloadSigned -> PayloadSigned. Appends one payload signature per
   * signer, in signer order. Throws InvalidArgument if the transaction already
   * carries envelope signatures. On any failure the input is left untouched and
   * no signature is returned.
   */
  Transaction sign_payload(Transaction transaction, std::span<const SignerCredential> signers);

  /**
   * -> FullySigned. Each envelope digest covers the payload and every payload
   * signature, indexed by position, so payload signing must be complete first.
   */
  Transaction sign_envelope(Transaction transaction, std::span<const SignerCredential> signers);

  Transaction sign_transaction(Transaction transaction,
                               std::span<const SignerCredential> payload_signers,
                               std::span<const SignerCredential> envelope_signers);

  // Checks one signature record against the matching signable bytes.
  bool verify_payload_signature(const Transaction& transaction, size_t index,
                                std::span<const uint8_t> public_key, const KeySpec& spec = {});
  bool verify_envelope_signature(const Transaction& transaction, size_t index,
                                 std::span<const uint8_t> public_key, const KeySpec& spec = {});
}
