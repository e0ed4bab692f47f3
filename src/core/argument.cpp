#include "flowtx/core/argument.hpp"
#include "flowtx/core/errors.hpp"
#include "flowtx/core/transaction.hpp"
#include <json/writer.h>
#include <charconv>
#include <cmath>

namespace flowtx::core {

  std::string format_fixed_point(double value) {
    if (!std::isfinite(value)) {
      throw InvalidArgument("fixed-point value must be finite");
    }
    if (value == 0.0) return "0";

    // DBL_MAX has 309 integer digits.
    char buffer[512];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
    if (ec != std::errc()) {
      throw InvalidArgument("fixed-point value cannot be formatted");
    }
    return std::string(buffer, end);
  }

  Argument::Argument(std::string type, Json::Value value)
    : type_(std::move(type)), value_(std::move(value)) {}

  Argument Argument::boolean(bool value) {
    return Argument("Bool", Json::Value(value));
  }

  Argument Argument::string(std::string value) {
    return Argument("String", Json::Value(std::move(value)));
  }

  Argument Argument::ufix64(double value) {
    if (std::isnan(value) || value < 0.0) {
      throw InvalidArgument("ufix64: value must not be negative");
    }
    return Argument("UFix64", Json::Value(format_fixed_point(value)));
  }

  Argument Argument::fix64(double value) {
    return Argument("Fix64", Json::Value(format_fixed_point(value)));
  }

  Argument Argument::uint8(uint8_t value) {
    return Argument("UInt8", Json::Value(std::to_string(value)));
  }

  Argument Argument::uint32(uint32_t value) {
    return Argument("UInt32", Json::Value(std::to_string(value)));
  }

  Argument Argument::uint64(uint64_t value) {
    return Argument("UInt64", Json::Value(std::to_string(value)));
  }

  Argument Argument::int32(int32_t value) {
    return Argument("Int32", Json::Value(std::to_string(value)));
  }

  Argument Argument::int64(int64_t value) {
    return Argument("Int64", Json::Value(std::to_string(value)));
  }

  Argument Argument::address(std::string_view hex) {
    auto fixed = address_from_hex(hex);
    return Argument("Address", Json::Value("0x" + to_hex(fixed)));
  }

  Argument Argument::array(const std::vector<Argument>& values) {
    Json::Value items(Json::arrayValue);
    for (const auto& v : values) items.append(v.to_json());
    return Argument("Array", std::move(items));
  }

  Argument Argument::dictionary(const std::vector<std::pair<std::string, std::string>>& entries) {
    Json::Value items(Json::arrayValue);
    for (const auto& [key, value] : entries) {
      Json::Value entry(Json::objectValue);
      entry["Key"] = key;
      entry["Value"] = value;
      items.append(std::move(entry));
    }
    return Argument("Dictionary", std::move(items));
  }

  Argument Argument::some(const Argument& value) {
    return Argument("Optional", value.to_json());
  }

  Argument Argument::none() {
    return Argument("Optional", Json::Value(Json::nullValue));
  }

  Json::Value Argument::to_json() const {
    Json::Value root(Json::objectValue);
    root["type"] = type_;
    root["value"] = value_;
    return root;
  }

  std::string Argument::to_json_string() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, to_json());
  }

  Bytes Argument::encode() const {
    return to_bytes(to_json_string());
  }

  std::vector<Bytes> encode_arguments(const std::vector<Argument>& arguments) {
    std::vector<Bytes> encoded;
    encoded.reserve(arguments.size());
    for (const auto& argument : arguments) encoded.push_back(argument.encode());
    return encoded;
  }
}
