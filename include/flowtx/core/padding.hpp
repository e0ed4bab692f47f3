#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "flowtx/core/errors.hpp"

namespace flowtx::core {

  /**
   * Zero-extend `bytes` on the left to exactly `width` bytes (big-endian
   * zero-extension). Never truncates: throws EncodingOverflow when the input
   * is already wider than `width`.
   */
  std::vector<uint8_t> pad_left(std::span<const uint8_t> bytes, size_t width);

  /**
   * Append zero bytes until `bytes` is `width` long. Same overflow rule as pad_left.
   */
  std::vector<uint8_t> pad_right(std::span<const uint8_t> bytes, size_t width);

  template <size_t N>
  std::array<uint8_t, N> to_fixed(std::span<const uint8_t> bytes) {
    if (bytes.size() > N) {
      throw EncodingOverflow("to_fixed: " + std::to_string(bytes.size()) +
                             " bytes exceed field width " + std::to_string(N));
    }
    std::array<uint8_t, N> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin() + (N - bytes.size()));
    return out;
  }
}
