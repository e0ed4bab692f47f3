#include "flowtx/core/transaction.hpp"
#include "flowtx/core/padding.hpp"

namespace flowtx::core {

  namespace {
    rlp::Item address_item(const Address& address) {
      return rlp::bytes(std::span<const uint8_t>(address.data(), address.size()));
    }
  }

  Address address_from_hex(std::string_view hex) {
    auto raw = from_hex(hex);
    return to_fixed<kAddressSize>(raw);
  }

  Identifier identifier_from_bytes(std::span<const uint8_t> bytes) {
    return to_fixed<kIdentifierSize>(bytes);
  }

  rlp::Item Transaction::payload_item() const {
    rlp::List argument_items;
    argument_items.reserve(arguments.size());
    for (const auto& argument : arguments) argument_items.push_back(rlp::bytes(argument));

    rlp::List authorizer_items;
    authorizer_items.reserve(authorizers.size());
    for (const auto& authorizer : authorizers) authorizer_items.push_back(address_item(authorizer));

    return rlp::list({
      rlp::bytes(script),
      rlp::list(std::move(argument_items)),
      rlp::bytes(std::span<const uint8_t>(reference_block_id.data(), reference_block_id.size())),
      rlp::integer(gas_limit),
      address_item(proposal_key.address),
      rlp::integer(proposal_key.key_index),
      rlp::integer(proposal_key.sequence_number),
      address_item(payer),
      rlp::list(std::move(authorizer_items)),
    });
  }

  rlp::Item Transaction::envelope_item() const {
    rlp::List signature_items;
    signature_items.reserve(payload_signatures.size());
    for (size_t i = 0; i < payload_signatures.size(); ++i) {
      const auto& sig = payload_signatures[i];
      signature_items.push_back(rlp::list({
        rlp::integer(i),
        rlp::integer(sig.key_index),
        rlp::bytes(sig.signature),
      }));
    }
    return rlp::list({payload_item(), rlp::list(std::move(signature_items))});
  }

  Transaction build_transaction(Bytes script, std::vector<Bytes> arguments,
    std::span<const uint8_t> reference_block_id, uint64_t gas_limit, ProposalKey proposer,
    const std::vector<std::string>& authorizers, std::string_view payer) {
    Transaction transaction;
    transaction.script = std::move(script);
    transaction.arguments = std::move(arguments);
    transaction.reference_block_id = identifier_from_bytes(reference_block_id);
    transaction.gas_limit = gas_limit;
    transaction.proposal_key = proposer;
    transaction.authorizers.reserve(authorizers.size());
    for (const auto& authorizer : authorizers) transaction.authorizers.push_back(address_from_hex(authorizer));
    transaction.payer = address_from_hex(payer);
    return transaction;
  }

  Transaction build_transaction(std::string_view script, const std::vector<Argument>& arguments,
    std::span<const uint8_t> reference_block_id, uint64_t gas_limit, ProposalKey proposer,
    const std::vector<std::string>& authorizers, std::string_view payer) {
    return build_transaction(to_bytes(script), encode_arguments(arguments), reference_block_id,
                             gas_limit, proposer, authorizers, payer);
  }
}
