#include "flowtx/core/keys.hpp"
#include "flowtx/core/errors.hpp"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/params.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <spdlog/spdlog.h>

namespace flowtx::core {

  namespace  {

    constexpr size_t kScalarSize = 32;
    constexpr size_t kPublicKeySize = 64;

    [[noreturn]] void throw_openssl_error(const std::string& context) {
      unsigned long err = ERR_get_error();
      char err_buf[256]{0};
      ERR_error_string_n(err, err_buf, sizeof(err_buf));
      ERR_clear_error();
      throw CryptoError(context + ": " + err_buf);
    }

    using EVP_PKEY_Ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using EVP_PKEY_CTX_Ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
    using EVP_MAC_Ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
    using EVP_MAC_CTX_Ptr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;
    using EC_GROUP_Ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
    using EC_POINT_Ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
    using ECDSA_SIG_Ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
    using BN_CTX_Ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
    using BIGNUM_Ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;

    using Scalar = std::array<uint8_t, kScalarSize>;

    // Zeroes a fixed buffer holding secret material when it leaves scope.
    template <class T> struct Cleanse {
      T& buffer;
      ~Cleanse() { OPENSSL_cleanse(buffer.data(), buffer.size()); }
    };

    BIGNUM_Ptr new_bn() {
      BIGNUM_Ptr bn(BN_secure_new(), &BN_clear_free);
      if (!bn) throw_openssl_error("BN_secure_new");
      return bn;
    }

    int curve_nid(SignatureAlgorithm algorithm) {
      switch (algorithm) {
        case SignatureAlgorithm::ECDSA_P256: return NID_X9_62_prime256v1;
        case SignatureAlgorithm::ECDSA_secp256k1: return NID_secp256k1;
      }
      throw InvalidArgument("unsupported signature algorithm");
    }

    const char* curve_group_name(SignatureAlgorithm algorithm) {
      switch (algorithm) {
        case SignatureAlgorithm::ECDSA_P256: return "prime256v1";
        case SignatureAlgorithm::ECDSA_secp256k1: return "secp256k1";
      }
      throw InvalidArgument("unsupported signature algorithm");
    }

    const EVP_MD* message_digest(HashAlgorithm algorithm) {
      switch (algorithm) {
        case HashAlgorithm::SHA2_256: return EVP_sha256();
        case HashAlgorithm::SHA3_256: return EVP_sha3_256();
      }
      throw InvalidArgument("unsupported hash algorithm");
    }

    const char* digest_name(HashAlgorithm algorithm) {
      switch (algorithm) {
        case HashAlgorithm::SHA2_256: return "SHA256";
        case HashAlgorithm::SHA3_256: return "SHA3-256";
      }
      throw InvalidArgument("unsupported hash algorithm");
    }

    EC_GROUP_Ptr new_group(SignatureAlgorithm algorithm) {
      EC_GROUP_Ptr group(EC_GROUP_new_by_curve_name(curve_nid(algorithm)), &EC_GROUP_free);
      if (!group) throw_openssl_error("EC_GROUP_new_by_curve_name");
      return group;
    }

    // Decodes the hex scalar and checks 0 < d < n. Never echoes key material.
    BIGNUM_Ptr decode_private_scalar(const PrivateKey& private_key, const BIGNUM* order) {
      auto hex = private_key.hex();
      if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex.remove_prefix(2);
      if (hex.size() != kScalarSize * 2) {
        throw CryptoError("private key must be " + std::to_string(kScalarSize) + " hex-encoded bytes");
      }

      Scalar raw{};
      Cleanse<Scalar> wipe_raw{raw};
      auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
      };
      for (size_t i = 0; i < raw.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) throw CryptoError("private key is not valid hex");
        raw[i] = static_cast<uint8_t>((hi << 4) | lo);
      }

      auto scalar = new_bn();
      if (!BN_bin2bn(raw.data(), static_cast<int>(raw.size()), scalar.get())) throw_openssl_error("BN_bin2bn");
      if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), order) >= 0) {
        throw CryptoError("private key is out of range for the curve");
      }
      BN_set_flags(scalar.get(), BN_FLG_CONSTTIME);
      return scalar;
    }

    Scalar to_scalar(const BIGNUM* value) {
      Scalar out{};
      if (BN_bn2binpad(value, out.data(), static_cast<int>(out.size())) != static_cast<int>(out.size())) {
        throw_openssl_error("BN_bn2binpad");
      }
      return out;
    }

    /**
     * RFC 6979 section 3.2 nonce derivation, specialised to 256-bit curve orders and
     * 256-bit digests (qlen == hlen), which covers both supported curves.
     * Each call to next() yields the following candidate k; the caller rejects
     * candidates outside [1, n-1] or that produce r == 0 / s == 0.
     */
    class NonceGenerator {
      public:
        NonceGenerator(HashAlgorithm algorithm, const Scalar& x, const Scalar& h1)
          : mac_(EVP_MAC_fetch(nullptr, "HMAC", nullptr), &EVP_MAC_free),
            digest_name_(digest_name(algorithm)) {
          if (!mac_) throw_openssl_error("EVP_MAC_fetch");
          key_.fill(0x00);
          value_.fill(0x01);

          const uint8_t zero = 0x00, one = 0x01;
          key_ = hmac({value_, std::span<const uint8_t>(&zero, 1), x, h1});
          value_ = hmac({value_});
          key_ = hmac({value_, std::span<const uint8_t>(&one, 1), x, h1});
          value_ = hmac({value_});
        }

        ~NonceGenerator() {
          OPENSSL_cleanse(key_.data(), key_.size());
          OPENSSL_cleanse(value_.data(), value_.size());
        }

        Scalar next() {
          if (!first_) {
            const uint8_t zero = 0x00;
            key_ = hmac({value_, std::span<const uint8_t>(&zero, 1)});
            value_ = hmac({value_});
          }
          first_ = false;
          value_ = hmac({value_});
          return value_;
        }

      private:
        Scalar hmac(std::initializer_list<std::span<const uint8_t>> parts) {
          EVP_MAC_CTX_Ptr ctx(EVP_MAC_CTX_new(mac_.get()), &EVP_MAC_CTX_free);
          if (!ctx) throw_openssl_error("EVP_MAC_CTX_new");

          OSSL_PARAM params[2] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, const_cast<char*>(digest_name_), 0),
            OSSL_PARAM_construct_end()
          };
          if (EVP_MAC_init(ctx.get(), key_.data(), key_.size(), params) != 1) throw_openssl_error("EVP_MAC_init");
          for (auto part : parts) {
            if (EVP_MAC_update(ctx.get(), part.data(), part.size()) != 1) throw_openssl_error("EVP_MAC_update");
          }
          Scalar out{};
          size_t out_len = 0;
          if (EVP_MAC_final(ctx.get(), out.data(), &out_len, out.size()) != 1 || out_len != out.size())
            throw_openssl_error("EVP_MAC_final");
          return out;
        }

        EVP_MAC_Ptr mac_;
        const char* digest_name_;
        Scalar key_{};
        Scalar value_{};
        bool first_ = true;
    };

    Bytes point_to_raw(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
      std::array<uint8_t, kPublicKeySize + 1> encoded{};
      size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                      encoded.data(), encoded.size(), ctx);
      if (len != encoded.size()) throw_openssl_error("EC_POINT_point2oct");
      return Bytes(encoded.begin() + 1, encoded.end());
    }
  }

  std::string to_string(SignatureAlgorithm algorithm) {
    switch (algorithm) {
      case SignatureAlgorithm::ECDSA_P256: return "ECDSA_P256";
      case SignatureAlgorithm::ECDSA_secp256k1: return "ECDSA_secp256k1";
    }
    return "unknown";
  }

  std::string to_string(HashAlgorithm algorithm) {
    switch (algorithm) {
      case HashAlgorithm::SHA2_256: return "SHA2_256";
      case HashAlgorithm::SHA3_256: return "SHA3_256";
    }
    return "unknown";
  }

  SignatureAlgorithm signature_algorithm_from_name(std::string_view name) {
    if (name == "ECDSA_P256") return SignatureAlgorithm::ECDSA_P256;
    if (name == "ECDSA_secp256k1") return SignatureAlgorithm::ECDSA_secp256k1;
    throw InvalidArgument("unknown signature algorithm: " + std::string(name));
  }

  HashAlgorithm hash_algorithm_from_name(std::string_view name) {
    if (name == "SHA2_256") return HashAlgorithm::SHA2_256;
    if (name == "SHA3_256") return HashAlgorithm::SHA3_256;
    throw InvalidArgument("unknown hash algorithm: " + std::string(name));
  }

  PrivateKey::PrivateKey(std::string_view hex) : hex_(hex.begin(), hex.end()) {}

  PrivateKey::~PrivateKey() { wipe(); }

  PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept {
    if (this != &other) {
      wipe();
      hex_ = std::move(other.hex_);
    }
    return *this;
  }

  void PrivateKey::wipe() noexcept {
    if (!hex_.empty()) OPENSSL_cleanse(hex_.data(), hex_.size());
    hex_.clear();
  }

  PrivateKey read_private_key_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw InvalidArgument("cannot open key file " + path);
    std::streamsize size = in.tellg();
    if (size < 0) throw InvalidArgument("cannot read key file " + path);

    // Sized once and never reallocated, so the cleanse below covers every copy.
    std::vector<char> contents(static_cast<size_t>(size));
    in.seekg(0);
    if (!in.read(contents.data(), size)) {
      OPENSSL_cleanse(contents.data(), contents.size());
      throw InvalidArgument("cannot read key file " + path);
    }

    std::string_view text(contents.data(), contents.size());
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);

    PrivateKey key(text);
    OPENSSL_cleanse(contents.data(), contents.size());
    return key;
  }

  bool crypto_init() {
    return OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr) == 1;
  }

  Hash256 hash_message(std::span<const uint8_t> message, HashAlgorithm algorithm) {
    switch (algorithm) {
      case HashAlgorithm::SHA2_256: return sha256(message);
      case HashAlgorithm::SHA3_256: return sha3_256(message);
    }
    throw InvalidArgument("unsupported hash algorithm");
  }

  KeyPair generate_keypair(SignatureAlgorithm algorithm) {
    EVP_PKEY_Ptr key_handle(nullptr, &EVP_PKEY_free);
    EVP_PKEY_CTX_Ptr keygen_ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), &EVP_PKEY_CTX_free);
    if (!keygen_ctx) throw_openssl_error("EVP_PKEY_CTX_new_from_name");

    if (EVP_PKEY_keygen_init(keygen_ctx.get()) <= 0) throw_openssl_error("EVP_PKEY_keygen_init");

    OSSL_PARAM params[2] = {
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
        const_cast<char*>(curve_group_name(algorithm)), 0),
        OSSL_PARAM_construct_end()
    };

    if (EVP_PKEY_CTX_set_params(keygen_ctx.get(), params) <= 0) throw_openssl_error("EVP_PKEY_CTX_set_params");

    EVP_PKEY* generated_key = nullptr;
    if (EVP_PKEY_keygen(keygen_ctx.get(), &generated_key) <= 0) throw_openssl_error("EVP_PKEY_keygen");
    key_handle.reset(generated_key);

    BIGNUM* raw_scalar = nullptr;
    if (EVP_PKEY_get_bn_param(key_handle.get(), OSSL_PKEY_PARAM_PRIV_KEY, &raw_scalar) != 1)
      throw_openssl_error("EVP_PKEY_get_bn_param");
    BIGNUM_Ptr scalar(raw_scalar, &BN_clear_free);

    auto scalar_bytes = to_scalar(scalar.get());
    Cleanse<Scalar> wipe_scalar{scalar_bytes};
    std::string hex = to_hex(scalar_bytes);
    PrivateKey private_key(hex);
    OPENSSL_cleanse(hex.data(), hex.size());

    auto public_key = derive_public_key(private_key, algorithm);
    spdlog::debug("generated {} key pair", to_string(algorithm));
    return {std::move(private_key), std::move(public_key)};
  }

  Bytes derive_public_key(const PrivateKey& private_key, SignatureAlgorithm algorithm) {
    auto group = new_group(algorithm);
    BN_CTX_Ptr ctx(BN_CTX_secure_new(), &BN_CTX_free);
    if (!ctx) throw_openssl_error("BN_CTX_secure_new");

    auto scalar = decode_private_scalar(private_key, EC_GROUP_get0_order(group.get()));

    EC_POINT_Ptr point(EC_POINT_new(group.get()), &EC_POINT_free);
    if (!point) throw_openssl_error("EC_POINT_new");
    if (EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr, nullptr, ctx.get()) != 1)
      throw_openssl_error("EC_POINT_mul");
    return point_to_raw(group.get(), point.get(), ctx.get());
  }

  Bytes sign_message(const PrivateKey& private_key, std::span<const uint8_t> message,
    const KeySpec& spec) {
      auto group = new_group(spec.signature);
      const BIGNUM* order = EC_GROUP_get0_order(group.get());
      BN_CTX_Ptr ctx(BN_CTX_secure_new(), &BN_CTX_free);
      if (!ctx) throw_openssl_error("BN_CTX_secure_new");

      auto d = decode_private_scalar(private_key, order);
      auto digest = hash_message(message, spec.hash);

      // e = bits2int(H(m)) mod n; qlen == hlen so no shift is needed.
      auto e = new_bn();
      if (!BN_bin2bn(digest.data(), static_cast<int>(digest.size()), e.get())) throw_openssl_error("BN_bin2bn");
      if (BN_nnmod(e.get(), e.get(), order, ctx.get()) != 1) throw_openssl_error("BN_nnmod");

      auto x = to_scalar(d.get());
      Cleanse<Scalar> wipe_x{x};
      NonceGenerator nonces(spec.hash, x, to_scalar(e.get()));

      auto k = new_bn();
      auto k_inverse = new_bn();
      auto r = new_bn();
      auto s = new_bn();
      auto rx = new_bn();
      EC_POINT_Ptr point(EC_POINT_new(group.get()), &EC_POINT_free);
      if (!point) throw_openssl_error("EC_POINT_new");

      for (;;) {
        auto candidate = nonces.next();
        Cleanse<Scalar> wipe_candidate{candidate};
        if (!BN_bin2bn(candidate.data(), static_cast<int>(candidate.size()), k.get())) throw_openssl_error("BN_bin2bn");
        if (BN_is_zero(k.get()) || BN_cmp(k.get(), order) >= 0) continue;
        BN_set_flags(k.get(), BN_FLG_CONSTTIME);

        // r = x(kG) mod n
        if (EC_POINT_mul(group.get(), point.get(), k.get(), nullptr, nullptr, ctx.get()) != 1)
          throw_openssl_error("EC_POINT_mul");
        if (EC_POINT_get_affine_coordinates(group.get(), point.get(), rx.get(), nullptr, ctx.get()) != 1)
          throw_openssl_error("EC_POINT_get_affine_coordinates");
        if (BN_nnmod(r.get(), rx.get(), order, ctx.get()) != 1) throw_openssl_error("BN_nnmod");
        if (BN_is_zero(r.get())) continue;

        // s = k^-1 (e + r d) mod n
        if (!BN_mod_inverse(k_inverse.get(), k.get(), order, ctx.get())) throw_openssl_error("BN_mod_inverse");
        if (BN_mod_mul(s.get(), r.get(), d.get(), order, ctx.get()) != 1) throw_openssl_error("BN_mod_mul");
        if (BN_mod_add(s.get(), s.get(), e.get(), order, ctx.get()) != 1) throw_openssl_error("BN_mod_add");
        if (BN_mod_mul(s.get(), s.get(), k_inverse.get(), order, ctx.get()) != 1) throw_openssl_error("BN_mod_mul");
        if (BN_is_zero(s.get())) continue;
        break;
      }

      Bytes signature;
      signature.reserve(2 * kScalarSize);
      auto r_bytes = to_scalar(r.get());
      auto s_bytes = to_scalar(s.get());
      signature.insert(signature.end(), r_bytes.begin(), r_bytes.end());
      signature.insert(signature.end(), s_bytes.begin(), s_bytes.end());
      return signature;
    }

  bool verify_message(std::span<const uint8_t> public_key, std::span<const uint8_t> message,
    std::span<const uint8_t> signature, const KeySpec& spec) {
      if (public_key.size() != kPublicKeySize) {
        throw CryptoError("public key must be " + std::to_string(kPublicKeySize) + " bytes, got " +
                          std::to_string(public_key.size()));
      }
      if (signature.size() != 2 * kScalarSize) return false;

      std::array<uint8_t, kPublicKeySize + 1> encoded{};
      encoded[0] = POINT_CONVERSION_UNCOMPRESSED;
      std::copy(public_key.begin(), public_key.end(), encoded.begin() + 1);

      OSSL_PARAM params[3] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
          const_cast<char*>(curve_group_name(spec.signature)), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, encoded.data(), encoded.size()),
        OSSL_PARAM_construct_end()
      };

      EVP_PKEY_CTX_Ptr import_ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), &EVP_PKEY_CTX_free);
      if (!import_ctx) throw_openssl_error("EVP_PKEY_CTX_new_from_name");
      if (EVP_PKEY_fromdata_init(import_ctx.get()) <= 0) throw_openssl_error("EVP_PKEY_fromdata_init");
      EVP_PKEY* raw_key = nullptr;
      if (EVP_PKEY_fromdata(import_ctx.get(), &raw_key, EVP_PKEY_PUBLIC_KEY, params) <= 0)
        throw_openssl_error("EVP_PKEY_fromdata");
      EVP_PKEY_Ptr key_handle(raw_key, &EVP_PKEY_free);

      ECDSA_SIG_Ptr sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
      if (!sig) throw_openssl_error("ECDSA_SIG_new");
      BIGNUM* r = BN_bin2bn(signature.data(), static_cast<int>(kScalarSize), nullptr);
      BIGNUM* s = BN_bin2bn(signature.data() + kScalarSize, static_cast<int>(kScalarSize), nullptr);
      if (!r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
        BN_free(r);
        BN_free(s);
        throw_openssl_error("ECDSA_SIG_set0");
      }

      unsigned char* der = nullptr;
      int der_len = i2d_ECDSA_SIG(sig.get(), &der);
      if (der_len <= 0) throw_openssl_error("i2d_ECDSA_SIG");
      std::unique_ptr<unsigned char, void (*)(unsigned char*)> der_guard(
        der, [](unsigned char* p) { OPENSSL_free(p); });

      EVP_MD_CTX_Ptr verify_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!verify_ctx) throw_openssl_error("EVP_MD_CTX_new");

      if (EVP_DigestVerifyInit(verify_ctx.get(), nullptr, message_digest(spec.hash), nullptr, key_handle.get()) <= 0)
        throw_openssl_error("EVP_DigestVerifyInit");

      int result = EVP_DigestVerify(verify_ctx.get(), der, static_cast<size_t>(der_len),
                                    message.data(), message.size());
      ERR_clear_error();
      return (result == 1);
    }

  }
