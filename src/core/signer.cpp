#include "flowtx/core/signer.hpp"
#include "flowtx/core/errors.hpp"
#include "flowtx/core/padding.hpp"
#include <spdlog/spdlog.h>

namespace flowtx::core {

  namespace {

    Bytes with_domain_tag(const Bytes& message) {
      Bytes out = transaction_domain_tag();
      out.insert(out.end(), message.begin(), message.end());
      return out;
    }

    std::vector<TransactionSignature> sign_all(const Bytes& signable,
                                               std::span<const SignerCredential> signers,
                                               const char* stage) {
      std::vector<TransactionSignature> signatures;
      signatures.reserve(signers.size());
      for (const auto& signer : signers) {
        TransactionSignature record;
        record.address = address_from_hex(signer.address);
        record.key_index = signer.key_index;
        record.signature = sign_message(signer.private_key, signable, signer.key_spec);
        spdlog::debug("{} signature #{} by 0x{} key {}", stage, signatures.size(),
                      to_hex(record.address), record.key_index);
        signatures.push_back(std::move(record));
      }
      return signatures;
    }

    const TransactionSignature& signature_at(const std::vector<TransactionSignature>& signatures,
                                             size_t index, const char* what) {
      if (index >= signatures.size()) {
        throw InvalidArgument(std::string(what) + ": no signature at index " + std::to_string(index));
      }
      return signatures[index];
    }
  }

  const Bytes& transaction_domain_tag() {
    static const Bytes tag = pad_right(to_bytes(kTransactionDomainTag), kDomainTagSize);
    return tag;
  }

  Bytes payload_signable(const Transaction& transaction) {
    return with_domain_tag(transaction.payload_message());
  }

  Bytes envelope_signable(const Transaction& transaction) {
    return with_domain_tag(transaction.envelope_message());
  }

  Transaction sign_payload(Transaction transaction, std::span<const SignerCredential> signers) {
    if (transaction.signing_state == SigningState::FullySigned || !transaction.envelope_signatures.empty()) {
      throw InvalidArgument("sign_payload: transaction already carries envelope signatures");
    }

    auto signatures = sign_all(payload_signable(transaction), signers, "payload");

    transaction.payload_signatures.insert(transaction.payload_signatures.end(),
                                          std::make_move_iterator(signatures.begin()),
                                          std::make_move_iterator(signatures.end()));
    transaction.signing_state = SigningState::PayloadSigned;
    return transaction;
  }

  Transaction sign_envelope(Transaction transaction, std::span<const SignerCredential> signers) {
    auto signatures = sign_all(envelope_signable(transaction), signers, "envelope");

    transaction.envelope_signatures.insert(transaction.envelope_signatures.end(),
                                           std::make_move_iterator(signatures.begin()),
                                           std::make_move_iterator(signatures.end()));
    transaction.signing_state = SigningState::FullySigned;
    return transaction;
  }

  Transaction sign_transaction(Transaction transaction,
                               std::span<const SignerCredential> payload_signers,
                               std::span<const SignerCredential> envelope_signers) {
    auto payload_signed = sign_payload(std::move(transaction), payload_signers);
    return sign_envelope(std::move(payload_signed), envelope_signers);
  }

  bool verify_payload_signature(const Transaction& transaction, size_t index,
                                std::span<const uint8_t> public_key, const KeySpec& spec) {
    const auto& record = signature_at(transaction.payload_signatures, index, "verify_payload_signature");
    return verify_message(public_key, payload_signable(transaction), record.signature, spec);
  }

  bool verify_envelope_signature(const Transaction& transaction, size_t index,
                                 std::span<const uint8_t> public_key, const KeySpec& spec) {
    const auto& record = signature_at(transaction.envelope_signatures, index, "verify_envelope_signature");
    return verify_message(public_key, envelope_signable(transaction), record.signature, spec);
  }
}
