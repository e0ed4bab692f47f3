#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flowtx::core {
  using Hash256 = std::array<uint8_t, 32>;
  using Bytes = std::vector<uint8_t>;

  auto sha256(std::span<const uint8_t> data) -> Hash256;
  auto sha3_256(std::span<const uint8_t> data) -> Hash256;

  inline auto sha256(const std::string& data) -> Hash256 {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }
  inline auto sha3_256(const std::string& data) -> Hash256 {
    return sha3_256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  auto to_hex(std::span<const uint8_t> data) -> std::string;

  // Accepts upper or lower case digits and an optional "0x" prefix.
  // Throws DecodeError on odd length or a non-hex character.
  Bytes from_hex(std::string_view hex);

  inline Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
  }
}
