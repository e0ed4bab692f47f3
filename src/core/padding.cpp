#include "flowtx/core/padding.hpp"

namespace flowtx::core {

  namespace {
    void check_width(const char* what, size_t size, size_t width) {
      if (size > width) {
        throw EncodingOverflow(std::string(what) + ": " + std::to_string(size) +
                               " bytes exceed field width " + std::to_string(width));
      }
    }
  }

  std::vector<uint8_t> pad_left(std::span<const uint8_t> bytes, size_t width) {
    check_width("pad_left", bytes.size(), width);
    std::vector<uint8_t> out(width - bytes.size(), 0);
    out.insert(out.end(), bytes.begin(), bytes.end());
    return out;
  }

  std::vector<uint8_t> pad_right(std::span<const uint8_t> bytes, size_t width) {
    check_width("pad_right", bytes.size(), width);
    std::vector<uint8_t> out(bytes.begin(), bytes.end());
    out.resize(width, 0);
    return out;
  }
}
