#include <gtest/gtest.h>
#include "flowtx/core/rlp.hpp"
#include "flowtx/core/errors.hpp"

using namespace flowtx::core;

namespace {
  rlp::Item str(const std::string& s) { return rlp::bytes(to_bytes(s)); }
  std::string encode_hex(const rlp::Item& item) { return to_hex(rlp::encode(item)); }

  // `depth` empty lists wrapped in each other, built back to front.
  Bytes nested_lists(size_t depth) {
    Bytes reversed{rlp::kEmptyListCode};
    for (size_t i = 1; i < depth; ++i) {
      size_t length = reversed.size();
      if (length < rlp::kShortPayloadLimit) {
        reversed.push_back(static_cast<uint8_t>(rlp::kEmptyListCode + length));
        continue;
      }
      uint8_t length_of_length = 0;
      for (size_t v = length; v != 0; v >>= 8) {
        reversed.push_back(static_cast<uint8_t>(v & 0xff));
        ++length_of_length;
      }
      reversed.push_back(static_cast<uint8_t>(rlp::kLongListCode + length_of_length));
    }
    return Bytes(reversed.rbegin(), reversed.rend());
  }
}

TEST(Rlp, EncodesStrings) {
  EXPECT_EQ(encode_hex(str("dog")), "83646f67");
  EXPECT_EQ(encode_hex(str("")), "80");
  EXPECT_EQ(encode_hex(rlp::bytes(Bytes{0x00})), "00");
  EXPECT_EQ(encode_hex(rlp::bytes(Bytes{0x7f})), "7f");
  EXPECT_EQ(encode_hex(rlp::bytes(Bytes{0x80})), "8180");
}

TEST(Rlp, EncodesLongString) {
  const std::string lorem = "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
  ASSERT_EQ(lorem.size(), 56u);
  auto encoded = rlp::encode(str(lorem));
  ASSERT_EQ(encoded.size(), 58u);
  EXPECT_EQ(encoded[0], 0xb8);
  EXPECT_EQ(encoded[1], 56);
  EXPECT_EQ(std::string(encoded.begin() + 2, encoded.end()), lorem);
}

TEST(Rlp, EncodesIntegersAsMinimalBigEndian) {
  EXPECT_EQ(encode_hex(rlp::integer(0)), "80");
  EXPECT_EQ(encode_hex(rlp::integer(15)), "0f");
  EXPECT_EQ(encode_hex(rlp::integer(127)), "7f");
  EXPECT_EQ(encode_hex(rlp::integer(128)), "8180");
  EXPECT_EQ(encode_hex(rlp::integer(1024)), "820400");
  EXPECT_EQ(encode_hex(rlp::integer(UINT64_MAX)), "88ffffffffffffffff");
}

TEST(Rlp, EncodesLists) {
  EXPECT_EQ(encode_hex(rlp::list({})), "c0");
  EXPECT_EQ(encode_hex(rlp::list({str("cat"), str("dog")})), "c88363617483646f67");

  // [ [], [[]], [ [], [[]] ] ]
  auto nested = rlp::list({
    rlp::list({}),
    rlp::list({rlp::list({})}),
    rlp::list({rlp::list({}), rlp::list({rlp::list({})})}),
  });
  EXPECT_EQ(encode_hex(nested), "c7c0c1c0c3c0c1c0");
}

TEST(Rlp, EncodesLongList) {
  rlp::List items;
  for (int i = 0; i < 20; ++i) items.push_back(str("abc"));
  auto encoded = rlp::encode(rlp::list(items));
  // 20 * 4 = 80 bytes of payload
  ASSERT_EQ(encoded.size(), 82u);
  EXPECT_EQ(encoded[0], 0xf8);
  EXPECT_EQ(encoded[1], 80);
}

TEST(Rlp, WriterMatchesEncode) {
  rlp::Writer writer;
  writer.write_item(rlp::list({str("cat"), str("dog")}));
  writer.write_uint(1024);
  EXPECT_EQ(to_hex(writer.buffer()), "c88363617483646f67820400");
}

TEST(Rlp, DecodeReproducesStructure) {
  auto original = rlp::list({
    str("script"),
    rlp::list({str("a"), str(std::string(60, 'x'))}),
    rlp::integer(9999),
    rlp::list({}),
    rlp::list({rlp::list({rlp::integer(0), rlp::integer(7), rlp::bytes(Bytes(64, 0xEE))})}),
  });
  auto decoded = rlp::decode(rlp::encode(original));
  EXPECT_EQ(decoded, original);
  ASSERT_TRUE(decoded.is_list());
  ASSERT_EQ(decoded.list().size(), 5u);
  EXPECT_EQ(rlp::to_uint(decoded.list()[2]), 9999u);
  EXPECT_TRUE(decoded.list()[3].list().empty());
}

TEST(Rlp, DecodeRejectsMalformedInput) {
  EXPECT_THROW(rlp::decode(Bytes{}), DecodeError);
  EXPECT_THROW(rlp::decode(from_hex("83646f")), DecodeError);      // truncated string
  EXPECT_THROW(rlp::decode(from_hex("c88363617483646f")), DecodeError);  // truncated list
  EXPECT_THROW(rlp::decode(from_hex("83646f6700")), DecodeError);  // trailing byte
  EXPECT_THROW(rlp::decode(from_hex("8100")), DecodeError);        // single byte with header
  EXPECT_THROW(rlp::decode(from_hex("b80161")), DecodeError);      // long form for short string
}

TEST(Rlp, ToUintRejectsNonCanonicalIntegers) {
  EXPECT_THROW(rlp::to_uint(rlp::bytes(Bytes{0x00, 0x01})), DecodeError);
  EXPECT_THROW(rlp::to_uint(rlp::bytes(Bytes(9, 0x01))), DecodeError);
  EXPECT_THROW(rlp::to_uint(rlp::list({})), DecodeError);
  EXPECT_EQ(rlp::to_uint(rlp::bytes(Bytes{})), 0u);
}

TEST(Rlp, DecodeRejectsExcessiveNesting) {
  auto at_limit = rlp::decode(nested_lists(rlp::kMaxDepth));
  EXPECT_TRUE(at_limit.is_list());
  EXPECT_THROW(rlp::decode(nested_lists(rlp::kMaxDepth + 1)), DecodeError);
  // Deep enough to exhaust the stack if nesting were unbounded.
  EXPECT_THROW(rlp::decode(nested_lists(300000)), DecodeError);
}
