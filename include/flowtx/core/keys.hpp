#pragma once
#include <vector>
#include <cstdint>
#include <string>
#include <string_view>
#include <span>

#include <flowtx/core/hash.hpp>

namespace flowtx::core {

  // Numeric values are the account key codes used on chain.
  enum class SignatureAlgorithm : uint8_t {
    ECDSA_P256 = 2,
    ECDSA_secp256k1 = 3,
  };

  enum class HashAlgorithm : uint8_t {
    SHA2_256 = 1,
    SHA3_256 = 3,
  };

  /**
   * The algorithm pair an account key was registered with.
   * Defaults match the keys created by the standard account templates.
   */
  struct KeySpec {
    SignatureAlgorithm signature = SignatureAlgorithm::ECDSA_P256;
    HashAlgorithm hash = HashAlgorithm::SHA3_256;
  };

  std::string to_string(SignatureAlgorithm algorithm);
  std::string to_string(HashAlgorithm algorithm);

  // Accepts the names produced by to_string. Throws InvalidArgument otherwise.
  SignatureAlgorithm signature_algorithm_from_name(std::string_view name);
  HashAlgorithm hash_algorithm_from_name(std::string_view name);

  /**
   * Hex-encoded private scalar held as a short-lived secret.
   * Move-only; the buffer is cleansed when the object is destroyed or overwritten.
   * The hex is not validated here: decoding happens inside the signing call.
   */
  class PrivateKey {
    public:
      explicit PrivateKey(std::string_view hex);
      ~PrivateKey();

      PrivateKey(PrivateKey&& other) noexcept = default;
      PrivateKey& operator=(PrivateKey&& other) noexcept;
      PrivateKey(const PrivateKey&) = delete;
      PrivateKey& operator=(const PrivateKey&) = delete;

      std::string_view hex() const { return std::string_view(hex_.data(), hex_.size()); }

    private:
      void wipe() noexcept;
      std::vector<char> hex_;
  };

  /**
   * Load a hex private key from a file, ignoring surrounding whitespace.
   * The file contents are cleansed before returning.
   * Throws InvalidArgument if the file cannot be read.
   */
  PrivateKey read_private_key_file(const std::string& path);

  /**
   * Freshly generated key pair.
   * - private_key: 32-byte scalar, hex encoded
   * - public_key: 64 raw bytes, X || Y
   */
  struct KeyPair {
    PrivateKey private_key;
    Bytes public_key;
  };

  /**
   * Initialize crypto subsystem; must be called once at startup.
   * Returns true on success.
   */
  bool crypto_init();

  Hash256 hash_message(std::span<const uint8_t> message, HashAlgorithm algorithm);

  /**
   * Generate a new key pair on the given curve.
   * Throws CryptoError on failure.
   */
  KeyPair generate_keypair(SignatureAlgorithm algorithm = SignatureAlgorithm::ECDSA_P256);

  /**
   * Public key (X || Y, 64 bytes) for a private scalar.
   * Throws CryptoError if the key is not a valid scalar for the curve.
   */
  Bytes derive_public_key(const PrivateKey& private_key, SignatureAlgorithm algorithm);

  /**
   * Hash `message` with spec.hash and sign the digest with ECDSA on spec.signature.
   * The nonce is derived deterministically (RFC 6979), so identical inputs always
   * give identical signatures. Returns raw r || s, 32 bytes each.
   * Throws CryptoError on malformed key material.
   */
  Bytes sign_message(const PrivateKey& private_key, std::span<const uint8_t> message,
    const KeySpec& spec = {});

  /**
   * Verify a raw r || s signature against a 64-byte public key and message.
   * Returns false for a wrong or malformed signature; throws CryptoError if the
   * public key is not a point on the curve.
   */
  bool verify_message(std::span<const uint8_t> public_key, std::span<const uint8_t> message,
    std::span<const uint8_t> signature, const KeySpec& spec = {});

  /**
   * Convenience overloads for std::string
   */
  inline Bytes sign_message(const PrivateKey& private_key, const std::string& message,
    const KeySpec& spec = {}) {
    return sign_message(private_key, std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(message.data()), message.size()), spec);
  }

  inline bool verify_message(std::span<const uint8_t> public_key, const std::string& message,
    std::span<const uint8_t> signature, const KeySpec& spec = {}) {
    return verify_message(public_key, std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(message.data()), message.size()), signature, spec);
  }
}
