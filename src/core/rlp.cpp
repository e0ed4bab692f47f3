#include "flowtx/core/rlp.hpp"
#include "flowtx/core/errors.hpp"
#include <string>

namespace flowtx::core::rlp {

  namespace {
    Bytes big_endian_compact(uint64_t value) {
      Bytes out;
      while (value > 0) {
        out.insert(out.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
      }
      return out;
    }
  }

  Item bytes(std::span<const uint8_t> data) {
    return Item{Bytes(data.begin(), data.end())};
  }

  Item integer(uint64_t value) {
    return Item{big_endian_compact(value)};
  }

  Item list(List items) {
    return Item{std::move(items)};
  }

  void Writer::write_header(bool is_list, size_t payload_length) {
    if (payload_length < kShortPayloadLimit) {
      const uint8_t code = is_list ? kEmptyListCode : kEmptyStringCode;
      buffer_.push_back(static_cast<uint8_t>(code + payload_length));
      return;
    }
    auto length_bytes = big_endian_compact(payload_length);
    const uint8_t code = is_list ? kLongListCode : kLongStringCode;
    buffer_.push_back(static_cast<uint8_t>(code + length_bytes.size()));
    buffer_.insert(buffer_.end(), length_bytes.begin(), length_bytes.end());
  }

  void Writer::write_bytes(std::span<const uint8_t> data) {
    if (data.size() != 1 || data[0] >= kEmptyStringCode) {
      write_header(false, data.size());
    }
    buffer_.insert(buffer_.end(), data.begin(), data.end());
  }

  void Writer::write_uint(uint64_t value) {
    auto be = big_endian_compact(value);
    write_bytes(std::span<const uint8_t>(be.data(), be.size()));
  }

  void Writer::write_item(const Item& item) {
    if (!item.is_list()) {
      const auto& data = item.bytes();
      write_bytes(std::span<const uint8_t>(data.data(), data.size()));
      return;
    }
    Writer payload;
    for (const auto& child : item.list()) payload.write_item(child);
    write_header(true, payload.buffer().size());
    buffer_.insert(buffer_.end(), payload.buffer().begin(), payload.buffer().end());
  }

  void Reader::ensure(bool condition, const char* what) const {
    if (!condition) throw DecodeError(std::string("rlp: ") + what + " at offset " + std::to_string(pos_));
  }

  size_t Reader::read_length(uint8_t length_of_length) {
    ensure(length_of_length <= sizeof(uint64_t), "length of length too large");
    ensure(remaining_bytes() >= length_of_length, "truncated length");
    ensure(src_[pos_] != 0, "length with leading zero");
    uint64_t length = 0;
    for (uint8_t i = 0; i < length_of_length; ++i) length = (length << 8) | src_[pos_++];
    ensure(length >= kShortPayloadLimit, "long form used for short payload");
    return static_cast<size_t>(length);
  }

  Item Reader::read_item() {
    ensure(remaining_bytes() >= 1, "unexpected end of input");
    const uint8_t prefix = src_[pos_++];

    if (prefix < kEmptyStringCode) {
      return Item{Bytes{prefix}};
    }

    if (prefix < kEmptyListCode) {
      size_t length = prefix <= kLongStringCode
        ? static_cast<size_t>(prefix - kEmptyStringCode)
        : read_length(static_cast<uint8_t>(prefix - kLongStringCode));
      ensure(length <= remaining_bytes(), "truncated string");
      Bytes data(src_.begin() + pos_, src_.begin() + pos_ + length);
      pos_ += length;
      ensure(!(data.size() == 1 && data[0] < kEmptyStringCode), "single byte with string header");
      return Item{std::move(data)};
    }

    size_t length = prefix <= kLongListCode
      ? static_cast<size_t>(prefix - kEmptyListCode)
      : read_length(static_cast<uint8_t>(prefix - kLongListCode));
    ensure(length <= remaining_bytes(), "truncated list");
    ensure(depth_ < kMaxDepth, "list nesting too deep");
    Reader payload(src_.subspan(pos_, length), depth_ + 1);
    pos_ += length;

    List children;
    while (payload.remaining_bytes() > 0) children.push_back(payload.read_item());
    return Item{std::move(children)};
  }

  Bytes encode(const Item& item) {
    Writer writer;
    writer.write_item(item);
    return writer.take();
  }

  Item decode(std::span<const uint8_t> encoded) {
    Reader reader(encoded);
    auto item = reader.read_item();
    if (reader.remaining_bytes() != 0) {
      throw DecodeError("rlp: " + std::to_string(reader.remaining_bytes()) + " trailing bytes");
    }
    return item;
  }

  uint64_t to_uint(const Item& item) {
    if (item.is_list()) throw DecodeError("rlp: expected integer, found list");
    const auto& data = item.bytes();
    if (data.size() > sizeof(uint64_t)) throw DecodeError("rlp: integer wider than 64 bits");
    if (!data.empty() && data[0] == 0) throw DecodeError("rlp: integer with leading zero");
    uint64_t value = 0;
    for (auto b : data) value = (value << 8) | b;
    return value;
  }
}
