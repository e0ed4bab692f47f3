#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <flowtx/core/argument.hpp>
#include <flowtx/core/hash.hpp>
#include <flowtx/core/rlp.hpp>

namespace flowtx::core {

  inline constexpr size_t kAddressSize = 8;
  inline constexpr size_t kIdentifierSize = 32;

  // Fixed-width fields. Shorter inputs are left-padded with zeros when converted.
  using Address = std::array<uint8_t, kAddressSize>;
  using Identifier = std::array<uint8_t, kIdentifierSize>;

  // Throws DecodeError on malformed hex, EncodingOverflow if wider than 8 bytes.
  Address address_from_hex(std::string_view hex);
  Identifier identifier_from_bytes(std::span<const uint8_t> bytes);

  struct ProposalKey {
    Address address{};
    uint32_t key_index = 0;
    uint64_t sequence_number = 0;
  };

  struct TransactionSignature {
    Address address{};
    uint32_t key_index = 0;
    Bytes signature;
  };

  enum class SigningState {
    Unsigned,
    PayloadSigned,
    FullySigned,
  };

  struct Transaction {
    Bytes script;
    std::vector<Bytes> arguments;
    Identifier reference_block_id{};
    uint64_t gas_limit = 0;
    ProposalKey proposal_key;
    std::vector<Address> authorizers;
    Address payer{};

    std::vector<TransactionSignature> payload_signatures;
    std::vector<TransactionSignature> envelope_signatures;

    SigningState signing_state = SigningState::Unsigned;

    // [script, [arguments], reference_block_id, gas_limit, proposer address,
    //  proposer key index, proposer sequence number, payer, [authorizers]]
    rlp::Item payload_item() const;

    // [payload, [[position in payload_signatures, key index, signature], ...]]
    rlp::Item envelope_item() const;

    Bytes payload_message() const { return rlp::encode(payload_item()); }
    Bytes envelope_message() const { return rlp::encode(envelope_item()); }
  };

  /**
   * Assemble an unsigned transaction. Authorizer and payer addresses are hex decoded
   * and left-padded here, and the reference block id is padded to 32 bytes, so every
   * width error surfaces at build time (DecodeError / EncodingOverflow).
   */
  Transaction build_transaction(Bytes script, std::vector<Bytes> arguments,
    std::span<const uint8_t> reference_block_id, uint64_t gas_limit, ProposalKey proposer,
    const std::vector<std::string>& authorizers, std::string_view payer);

  Transaction build_transaction(std::string_view script, const std::vector<Argument>& arguments,
    std::span<const uint8_t> reference_block_id, uint64_t gas_limit, ProposalKey proposer,
    const std::vector<std::string>& authorizers, std::string_view payer);
}
