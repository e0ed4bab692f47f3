#include "flowtx/core/account_key.hpp"
#include "flowtx/core/errors.hpp"
#include "flowtx/core/rlp.hpp"

namespace flowtx::core {

  std::string encode_account_key(std::span<const uint8_t> public_key, const KeySpec& spec,
                                 uint32_t weight) {
    if (public_key.size() != 64) {
      throw InvalidArgument("encode_account_key: public key must be 64 bytes, got " +
                            std::to_string(public_key.size()));
    }
    auto encoded = rlp::encode(rlp::list({
      rlp::bytes(public_key),
      rlp::integer(static_cast<uint64_t>(spec.signature)),
      rlp::integer(static_cast<uint64_t>(spec.hash)),
      rlp::integer(weight),
    }));
    return to_hex(encoded);
  }

  std::string encode_account_key(std::string_view public_key_hex, const KeySpec& spec,
                                 uint32_t weight) {
    auto public_key = from_hex(public_key_hex);
    return encode_account_key(std::span<const uint8_t>(public_key.data(), public_key.size()), spec, weight);
  }

  Argument account_keys_argument(const std::vector<std::string>& public_keys_hex,
                                 const KeySpec& spec, uint32_t weight) {
    std::vector<Argument> keys;
    keys.reserve(public_keys_hex.size());
    for (const auto& key : public_keys_hex) {
      keys.push_back(Argument::string(encode_account_key(std::string_view(key), spec, weight)));
    }
    return Argument::array(keys);
  }
}
