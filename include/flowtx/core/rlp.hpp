#pragma once
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include "flowtx/core/hash.hpp"

// Recursive Length Prefix encoding, the canonical form Flow signs and transports.
namespace flowtx::core::rlp {

  inline constexpr uint8_t kEmptyStringCode = 0x80;
  inline constexpr uint8_t kLongStringCode = 0xB7;
  inline constexpr uint8_t kEmptyListCode = 0xC0;
  inline constexpr uint8_t kLongListCode = 0xF7;
  inline constexpr size_t kShortPayloadLimit = 56;
  // Deepest list nesting the decoder accepts.
  inline constexpr size_t kMaxDepth = 1024;

  struct Item;
  using List = std::vector<Item>;

  // A node of the encoding tree: either a byte string or an ordered list of items.
  struct Item {
    std::variant<Bytes, List> value;

    bool is_list() const { return std::holds_alternative<List>(value); }
    const Bytes& bytes() const { return std::get<Bytes>(value); }
    const List& list() const { return std::get<List>(value); }

    bool operator==(const Item&) const = default;
  };

  Item bytes(std::span<const uint8_t> data);
  // Unsigned integers are minimal big-endian strings; zero is the empty string.
  Item integer(uint64_t value);
  Item list(List items);

  class Writer {
    public:
      void write_bytes(std::span<const uint8_t> data);
      void write_uint(uint64_t value);
      void write_item(const Item& item);

      const Bytes& buffer() const { return buffer_; }
      Bytes take() { return std::move(buffer_); }

    private:
      void write_header(bool is_list, size_t payload_length);
      Bytes buffer_;
  };

  // Strict decoder: rejects truncated input, non-canonical length prefixes and
  // lists nested deeper than kMaxDepth.
  class Reader {
    public:
      explicit Reader(std::span<const uint8_t> src, size_t depth = 0) : src_(src), depth_(depth) {}

      Item read_item();
      size_t remaining_bytes() const { return src_.size() - pos_; }

    private:
      size_t read_length(uint8_t length_of_length);
      void ensure(bool condition, const char* what) const;

      std::span<const uint8_t> src_;
      size_t pos_ = 0;
      size_t depth_ = 0;
  };

  Bytes encode(const Item& item);

  // Decodes exactly one item; trailing bytes are an error.
  Item decode(std::span<const uint8_t> encoded);

  // Interprets a decoded byte string as a canonical unsigned integer.
  uint64_t to_uint(const Item& item);
}
