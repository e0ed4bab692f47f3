#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <flowtx/core/argument.hpp>
#include <flowtx/core/keys.hpp>

namespace flowtx::core {

  inline constexpr uint32_t kDefaultKeyWeight = 1000;

  /**
   * Hex RLP encoding of [public_key, signature algorithm, hash algorithm, weight],
   * the form account templates pass to `addPublicKey(key.decodeHex())`.
   * The public key must be 64 raw bytes (X || Y); InvalidArgument otherwise.
   */
  std::string encode_account_key(std::span<const uint8_t> public_key, const KeySpec& spec = {},
                                 uint32_t weight = kDefaultKeyWeight);
  std::string encode_account_key(std::string_view public_key_hex, const KeySpec& spec = {},
                                 uint32_t weight = kDefaultKeyWeight);

  // [String] argument holding one encoded key per public key.
  Argument account_keys_argument(const std::vector<std::string>& public_keys_hex,
                                 const KeySpec& spec = {}, uint32_t weight = kDefaultKeyWeight);
}
