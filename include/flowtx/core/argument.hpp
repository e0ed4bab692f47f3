#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <json/value.h>
#include "flowtx/core/hash.hpp"

namespace flowtx::core {

  /**
   * A script or transaction parameter in the JSON-Cadence value format:
   * {"type": "<Cadence type>", "value": ...}.
   *
   * This is the interpreter-facing codec. It is unrelated to the RLP encoding used
   * for signing; a transaction only ever sees the bytes returned by encode().
   *
   * Integer and fixed-point values travel as decimal strings.
   */
  class Argument {
    public:
      static Argument boolean(bool value);
      static Argument string(std::string value);

      // Throws InvalidArgument for negative or non-finite input.
      static Argument ufix64(double value);
      // Throws InvalidArgument for non-finite input.
      static Argument fix64(double value);

      static Argument uint8(uint8_t value);
      static Argument uint32(uint32_t value);
      static Argument uint64(uint64_t value);
      static Argument int32(int32_t value);
      static Argument int64(int64_t value);

      // Hex account address, with or without 0x. Normalised to 0x + 16 digits.
      static Argument address(std::string_view hex);

      static Argument array(const std::vector<Argument>& values);
      // Entries keep the given order.
      static Argument dictionary(const std::vector<std::pair<std::string, std::string>>& entries);

      static Argument some(const Argument& value);
      static Argument none();

      const std::string& type() const { return type_; }
      const Json::Value& value() const { return value_; }

      Json::Value to_json() const;
      std::string to_json_string() const;
      Bytes encode() const;

    private:
      Argument(std::string type, Json::Value value);

      std::string type_;
      Json::Value value_;
  };

  std::vector<Bytes> encode_arguments(const std::vector<Argument>& arguments);

  // Shortest decimal that round-trips `value`, in plain (non-exponent) notation.
  std::string format_fixed_point(double value);
}
