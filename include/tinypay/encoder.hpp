// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Canonical (BCS-like) Encoder
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tinypay
{

/// Structured value accepted by the canonical encoder
///
/// Closed set of kinds. Anything else (null, floating point) is rejected
/// when converting from JSON, before a Value exists.
class Value
{
public:
  using Bytes = std::vector<uint8_t>;
  using Sequence = std::vector<Value>;
  using Entry = std::pair<std::string, Value>;
  using Mapping = std::vector<Entry>; // insertion order, sorted on encode

  enum class Kind
  {
    Boolean,
    UnsignedInteger,
    Text,
    ByteSequence,
    OrderedSequence,
    KeyedMapping
  };

  static Value boolean (bool v);
  static Value unsigned_integer (uint64_t v);

  /// @throws Error{InvalidArgument} if v is negative
  static Value integer (int64_t v);

  static Value text (std::string v);
  static Value bytes (Bytes v);
  static Value sequence (Sequence v);
  static Value mapping (Mapping v);

  Kind kind () const;

  bool as_bool () const;
  uint64_t as_uint () const;
  const std::string &as_text () const;
  const Bytes &as_bytes () const;
  const Sequence &as_sequence () const;
  const Mapping &as_mapping () const;

  bool operator== (const Value &other) const;
  bool operator!= (const Value &other) const;

private:
  using Data = std::variant<bool, uint64_t, std::string, Bytes, Sequence,
                            Mapping>;

  explicit Value (Data data);

  Data data_;
};

/// Name of a value kind (e.g. "KeyedMapping")
const char *to_string (Value::Kind kind);

/// Canonical byte encoding
///
///   Boolean          1 byte, 0x01 / 0x00
///   UnsignedInteger  8 bytes little-endian
///   Text             u64 LE byte length + UTF-8 bytes
///   ByteSequence     u64 LE length + raw bytes
///   OrderedSequence  u64 LE element count + each element, in order
///   KeyedMapping     each value in ascending key order, keys not emitted
///
/// The mapping rule only matches a contract struct whose fields are
/// declared in alphabetical order. Two mappings with different keys but
/// the same values in the same sorted order encode identically.
///
/// @throws Error{InvalidArgument} on duplicate mapping keys
std::vector<uint8_t> encode (const Value &value);

/// Lowercase hex SHA256 of the canonical encoding
std::string move_compatible_hash (const Value &value);

/// Convert parsed JSON to a Value
/// @throws Error{InvalidArgument} on negative integers
/// @throws Error{UnsupportedType} on null or floating-point numbers
Value from_json (const nlohmann::json &json);

/// Parse free-form input: JSON, then a decimal integer, then plain text
Value parse_input (std::string_view input);

/// Parse input that must be JSON
/// @throws Error{ParseError} on malformed JSON
Value parse_json_input (std::string_view input);

/// One-line description for debug output, e.g. "OrderedSequence(3)"
std::string describe (const Value &value);

} // namespace tinypay
