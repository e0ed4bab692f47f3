#include "flowtx/core/hash.hpp"
#include "flowtx/core/errors.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace flowtx::core {

  namespace {
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    Hash256 digest(const EVP_MD* md, std::span<const uint8_t> data) {
      Hash256 out{};
      EVP_MD_CTX_Ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!ctx) throw CryptoError("EVP_MD_CTX_new failed");
      if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
        throw CryptoError("EVP_DigestInit_ex failed");
      if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        throw CryptoError("EVP_DigestUpdate failed");
      unsigned int len = static_cast<unsigned int>(out.size());
      if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size())
        throw CryptoError("EVP_DigestFinal_ex failed");
      return out;
    }

    int hex_value(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    }
  }

  auto to_hex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  auto sha256(std::span<const uint8_t> data) -> Hash256 {
    return digest(EVP_sha256(), data);
  }

  auto sha3_256(std::span<const uint8_t> data) -> Hash256 {
    return digest(EVP_sha3_256(), data);
  }

  Bytes from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex.remove_prefix(2);
    if (hex.size() % 2 != 0) {
      throw DecodeError("from_hex: odd number of digits (" + std::to_string(hex.size()) + ")");
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
      int hi = hex_value(hex[i]);
      int lo = hex_value(hex[i + 1]);
      if (hi < 0 || lo < 0) {
        throw DecodeError("from_hex: invalid character at offset " + std::to_string(hi < 0 ? i : i + 1));
      }
      out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
  }
}
