// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Canonical Encoder Implementation
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/encoder.hpp"
#include "tinypay/error.hpp"
#include "tinypay/log.hpp"
#include "tinypay/utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <optional>

namespace tinypay
{

namespace
{
// u64, little-endian
void
put_u64 (std::vector<uint8_t> &out, uint64_t value)
{
  for (int i = 0; i < 8; ++i)
    {
      out.push_back (static_cast<uint8_t> ((value >> (i * 8)) & 0xff));
    }
}

void
encode_into (const Value &value, std::vector<uint8_t> &out)
{
  switch (value.kind ())
    {
    case Value::Kind::Boolean:
      out.push_back (value.as_bool () ? 0x01 : 0x00);
      break;

    case Value::Kind::UnsignedInteger:
      put_u64 (out, value.as_uint ());
      break;

    case Value::Kind::Text:
      {
        const std::string &text = value.as_text ();
        put_u64 (out, text.size ());
        out.insert (out.end (), text.begin (), text.end ());
        break;
      }

    case Value::Kind::ByteSequence:
      {
        const Value::Bytes &bytes = value.as_bytes ();
        put_u64 (out, bytes.size ());
        out.insert (out.end (), bytes.begin (), bytes.end ());
        break;
      }

    case Value::Kind::OrderedSequence:
      {
        const Value::Sequence &items = value.as_sequence ();
        put_u64 (out, items.size ());
        for (const auto &item : items)
          {
            encode_into (item, out);
          }
        break;
      }

    case Value::Kind::KeyedMapping:
      {
        // Keys are sorted bytewise (UTF-8 code point order) and dropped
        std::vector<const Value::Entry *> entries;
        entries.reserve (value.as_mapping ().size ());
        for (const auto &entry : value.as_mapping ())
          {
            entries.push_back (&entry);
          }
        std::sort (entries.begin (), entries.end (),
                   [] (const Value::Entry *a, const Value::Entry *b) {
                     return a->first < b->first;
                   });

        for (size_t i = 0; i < entries.size (); ++i)
          {
            if (i > 0 && entries[i - 1]->first == entries[i]->first)
              {
                throw Error (ErrorKind::InvalidArgument,
                             "duplicate mapping key: " + entries[i]->first);
              }
            encode_into (entries[i]->second, out);
          }
        break;
      }
    }
}

std::string_view
trim (std::string_view s)
{
  const char *ws = " \t\r\n\f\v";
  size_t begin = s.find_first_not_of (ws);
  if (begin == std::string_view::npos)
    return {};
  size_t end = s.find_last_not_of (ws);
  return s.substr (begin, end - begin + 1);
}

bool
is_integer_literal (std::string_view s)
{
  if (!s.empty () && (s[0] == '+' || s[0] == '-'))
    s.remove_prefix (1);
  return !s.empty ()
         && s.find_first_not_of ("0123456789") == std::string_view::npos;
}

Value
parse_integer_literal (std::string_view s)
{
  bool negative = false;
  if (s[0] == '+' || s[0] == '-')
    {
      negative = (s[0] == '-');
      s.remove_prefix (1);
    }

  uint64_t value = 0;
  for (char c : s)
    {
      uint64_t digit = static_cast<uint64_t> (c - '0');
      if (value > (UINT64_MAX - digit) / 10)
        {
          throw Error (ErrorKind::InvalidArgument,
                       "integer does not fit in 64 bits: " + std::string (s));
        }
      value = value * 10 + digit;
    }

  if (negative && value != 0)
    {
      throw Error (ErrorKind::InvalidArgument,
                   "negative integers have no canonical encoding");
    }
  return Value::unsigned_integer (value);
}

bool
is_float_literal (std::string_view s)
{
  std::string text (s);
  char *end = nullptr;
  std::strtod (text.c_str (), &end);
  return end != text.c_str () && *end == '\0';
}

// Builds a Value straight from JSON text. Working on tokens keeps the
// source digits of numbers nlohmann can only store as double, so an
// oversized integer is reported as such rather than as a float.
// Conversion failures are held until the whole text has parsed: text that
// is not JSON at all must still reach the plain-text fallback.
class ValueBuilder : public nlohmann::json_sax<nlohmann::json>
{
public:
  bool
  null () override
  {
    fail (Error (ErrorKind::UnsupportedType,
                 "unsupported value type: null"));
    return add (Value::boolean (false));
  }

  bool
  boolean (bool val) override
  {
    return add (Value::boolean (val));
  }

  bool
  number_integer (number_integer_t val) override
  {
    if (val < 0)
      {
        fail (Error (ErrorKind::InvalidArgument,
                     "negative integers have no canonical encoding: "
                         + std::to_string (val)));
        return add (Value::boolean (false));
      }
    return add (Value::unsigned_integer (static_cast<uint64_t> (val)));
  }

  bool
  number_unsigned (number_unsigned_t val) override
  {
    return add (Value::unsigned_integer (val));
  }

  bool
  number_float (number_float_t, const string_t &literal) override
  {
    // Integer literals only land here when they overflow 64 bits
    if (is_integer_literal (literal))
      {
        try
          {
            return add (parse_integer_literal (literal));
          }
        catch (const Error &e)
          {
            fail (e);
            return add (Value::boolean (false));
          }
      }
    fail (Error (ErrorKind::UnsupportedType,
                 "floating-point numbers have no canonical encoding: "
                     + literal));
    return add (Value::boolean (false));
  }

  bool
  string (string_t &val) override
  {
    return add (Value::text (std::move (val)));
  }

  bool
  binary (binary_t &val) override
  {
    return add (Value::bytes (Value::Bytes (val.begin (), val.end ())));
  }

  bool
  start_object (std::size_t) override
  {
    frames_.push_back (Frame{ true, {}, {}, {} });
    return true;
  }

  bool
  key (string_t &val) override
  {
    frames_.back ().pending_key = std::move (val);
    return true;
  }

  bool
  end_object () override
  {
    Value::Mapping entries = std::move (frames_.back ().entries);
    frames_.pop_back ();
    return add (Value::mapping (std::move (entries)));
  }

  bool
  start_array (std::size_t) override
  {
    frames_.push_back (Frame{ false, {}, {}, {} });
    return true;
  }

  bool
  end_array () override
  {
    Value::Sequence items = std::move (frames_.back ().items);
    frames_.pop_back ();
    return add (Value::sequence (std::move (items)));
  }

  bool
  parse_error (std::size_t, const std::string &,
               const nlohmann::json::exception &ex) override
  {
    syntax_error_ = ex.what ();
    return false;
  }

  const std::string &
  syntax_error () const
  {
    return syntax_error_;
  }

  /// Parsed value; rethrows the first conversion failure
  Value
  result () const
  {
    if (!failures_.empty ())
      throw failures_.front ();
    return *result_;
  }

private:
  struct Frame
  {
    bool is_object;
    Value::Sequence items;
    Value::Mapping entries;
    std::string pending_key;
  };

  bool
  add (Value value)
  {
    if (frames_.empty ())
      {
        result_ = std::move (value);
      }
    else if (frames_.back ().is_object)
      {
        frames_.back ().entries.emplace_back (frames_.back ().pending_key,
                                              std::move (value));
      }
    else
      {
        frames_.back ().items.push_back (std::move (value));
      }
    return true;
  }

  void
  fail (const Error &error)
  {
    failures_.push_back (error);
  }

  std::vector<Frame> frames_;
  std::optional<Value> result_;
  std::vector<Error> failures_;
  std::string syntax_error_;
};
}

Value::Value (Data data) : data_ (std::move (data)) {}

Value
Value::boolean (bool v)
{
  return Value (Data (std::in_place_type<bool>, v));
}

Value
Value::unsigned_integer (uint64_t v)
{
  return Value (Data (std::in_place_type<uint64_t>, v));
}

Value
Value::integer (int64_t v)
{
  if (v < 0)
    {
      throw Error (ErrorKind::InvalidArgument,
                   "negative integers have no canonical encoding: "
                       + std::to_string (v));
    }
  return unsigned_integer (static_cast<uint64_t> (v));
}

Value
Value::text (std::string v)
{
  return Value (Data (std::in_place_type<std::string>, std::move (v)));
}

Value
Value::bytes (Bytes v)
{
  return Value (Data (std::in_place_type<Bytes>, std::move (v)));
}

Value
Value::sequence (Sequence v)
{
  return Value (Data (std::in_place_type<Sequence>, std::move (v)));
}

Value
Value::mapping (Mapping v)
{
  return Value (Data (std::in_place_type<Mapping>, std::move (v)));
}

Value::Kind
Value::kind () const
{
  return static_cast<Kind> (data_.index ());
}

bool
Value::as_bool () const
{
  return std::get<bool> (data_);
}

uint64_t
Value::as_uint () const
{
  return std::get<uint64_t> (data_);
}

const std::string &
Value::as_text () const
{
  return std::get<std::string> (data_);
}

const Value::Bytes &
Value::as_bytes () const
{
  return std::get<Bytes> (data_);
}

const Value::Sequence &
Value::as_sequence () const
{
  return std::get<Sequence> (data_);
}

const Value::Mapping &
Value::as_mapping () const
{
  return std::get<Mapping> (data_);
}

bool
Value::operator== (const Value &other) const
{
  return data_ == other.data_;
}

bool
Value::operator!= (const Value &other) const
{
  return !(*this == other);
}

const char *
to_string (Value::Kind kind)
{
  switch (kind)
    {
    case Value::Kind::Boolean:
      return "Boolean";
    case Value::Kind::UnsignedInteger:
      return "UnsignedInteger";
    case Value::Kind::Text:
      return "Text";
    case Value::Kind::ByteSequence:
      return "ByteSequence";
    case Value::Kind::OrderedSequence:
      return "OrderedSequence";
    case Value::Kind::KeyedMapping:
      return "KeyedMapping";
    }
  return "Unknown";
}

std::vector<uint8_t>
encode (const Value &value)
{
  std::vector<uint8_t> out;
  encode_into (value, out);
  return out;
}

std::string
move_compatible_hash (const Value &value)
{
  auto bytes = encode (value);
  log (LogLevel::Debug, "canonical bytes (" + std::to_string (bytes.size ())
                            + "): " + bytes_to_hex (bytes.data (), bytes.size ()));
  return sha256_hex (bytes.data (), bytes.size ());
}

Value
from_json (const nlohmann::json &json)
{
  switch (json.type ())
    {
    case nlohmann::json::value_t::boolean:
      return Value::boolean (json.get<bool> ());

    case nlohmann::json::value_t::number_unsigned:
      return Value::unsigned_integer (json.get<uint64_t> ());

    case nlohmann::json::value_t::number_integer:
      return Value::integer (json.get<int64_t> ());

    case nlohmann::json::value_t::string:
      return Value::text (json.get<std::string> ());

    case nlohmann::json::value_t::binary:
      {
        const auto &binary = json.get_binary ();
        return Value::bytes (Value::Bytes (binary.begin (), binary.end ()));
      }

    case nlohmann::json::value_t::array:
      {
        Value::Sequence items;
        items.reserve (json.size ());
        for (const auto &item : json)
          {
            items.push_back (from_json (item));
          }
        return Value::sequence (std::move (items));
      }

    case nlohmann::json::value_t::object:
      {
        Value::Mapping entries;
        entries.reserve (json.size ());
        for (const auto &item : json.items ())
          {
            entries.emplace_back (item.key (), from_json (item.value ()));
          }
        return Value::mapping (std::move (entries));
      }

    case nlohmann::json::value_t::number_float:
      throw Error (ErrorKind::UnsupportedType,
                   "floating-point numbers have no canonical encoding: "
                       + json.dump ());

    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
      break;
    }

  throw Error (ErrorKind::UnsupportedType,
               std::string ("unsupported value type: ") + json.type_name ());
}

Value
parse_input (std::string_view input)
{
  input = trim (input);

  ValueBuilder builder;
  if (nlohmann::json::sax_parse (std::string (input), &builder))
    {
      return builder.result ();
    }

  if (is_integer_literal (input))
    {
      return parse_integer_literal (input);
    }

  if (input.find ('.') != std::string_view::npos && is_float_literal (input))
    {
      throw Error (ErrorKind::UnsupportedType,
                   "floating-point numbers have no canonical encoding: "
                       + std::string (input));
    }

  return Value::text (std::string (input));
}

Value
parse_json_input (std::string_view input)
{
  ValueBuilder builder;
  if (!nlohmann::json::sax_parse (std::string (input), &builder))
    {
      throw Error (ErrorKind::ParseError,
                   "JSON parse error: " + builder.syntax_error ());
    }
  return builder.result ();
}

std::string
describe (const Value &value)
{
  std::string name = to_string (value.kind ());
  switch (value.kind ())
    {
    case Value::Kind::Boolean:
      return name + "(" + (value.as_bool () ? "true" : "false") + ")";
    case Value::Kind::UnsignedInteger:
      return name + "(" + std::to_string (value.as_uint ()) + ")";
    case Value::Kind::Text:
      return name + "(" + std::to_string (value.as_text ().size ()) + ")";
    case Value::Kind::ByteSequence:
      return name + "(" + std::to_string (value.as_bytes ().size ()) + ")";
    case Value::Kind::OrderedSequence:
      return name + "(" + std::to_string (value.as_sequence ().size ()) + ")";
    case Value::Kind::KeyedMapping:
      return name + "(" + std::to_string (value.as_mapping ().size ()) + ")";
    }
  return name;
}

} // namespace tinypay
