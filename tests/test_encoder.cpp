// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Canonical Encoder Tests
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/encoder.hpp"
#include "tinypay/error.hpp"
#include <functional>
#include <gtest/gtest.h>

using namespace tinypay;
using Bytes = std::vector<uint8_t>;

namespace
{
ErrorKind
error_kind_of (const std::function<void ()> &fn)
{
  try
    {
      fn ();
    }
  catch (const Error &e)
    {
      return e.kind ();
    }
  ADD_FAILURE () << "no error raised";
  return ErrorKind::ParseError;
}

Bytes
u64_le (uint64_t v)
{
  Bytes out;
  for (int i = 0; i < 8; ++i)
    out.push_back (static_cast<uint8_t> (v >> (i * 8)));
  return out;
}

Bytes
concat (std::initializer_list<Bytes> parts)
{
  Bytes out;
  for (const auto &p : parts)
    out.insert (out.end (), p.begin (), p.end ());
  return out;
}
}

TEST (Encoder, Boolean)
{
  EXPECT_EQ (encode (Value::boolean (true)), Bytes{ 0x01 });
  EXPECT_EQ (encode (Value::boolean (false)), Bytes{ 0x00 });
}

TEST (Encoder, UnsignedIntegerLittleEndian)
{
  EXPECT_EQ (encode (Value::unsigned_integer (256)),
             (Bytes{ 0, 1, 0, 0, 0, 0, 0, 0 }));
  EXPECT_EQ (encode (Value::unsigned_integer (0)), Bytes (8, 0));
  EXPECT_EQ (encode (Value::unsigned_integer (UINT64_MAX)), Bytes (8, 0xff));
  EXPECT_EQ (encode (Value::integer (1)), (Bytes{ 1, 0, 0, 0, 0, 0, 0, 0 }));
}

TEST (Encoder, NegativeIntegerRejected)
{
  EXPECT_EQ (error_kind_of ([] { Value::integer (-1); }),
             ErrorKind::InvalidArgument);
  EXPECT_EQ (error_kind_of ([] { from_json (nlohmann::json (-5)); }),
             ErrorKind::InvalidArgument);
  EXPECT_EQ (error_kind_of ([] { parse_input ("-7"); }),
             ErrorKind::InvalidArgument);
  EXPECT_EQ (error_kind_of ([] { parse_input ("[1, -2]"); }),
             ErrorKind::InvalidArgument);
}

TEST (Encoder, TextIsLengthPrefixedUtf8)
{
  EXPECT_EQ (encode (Value::text ("abc")),
             concat ({ u64_le (3), Bytes{ 'a', 'b', 'c' } }));
  EXPECT_EQ (encode (Value::text ("")), u64_le (0));

  // Byte length, not character count
  std::string e_acute = "\xc3\xa9";
  EXPECT_EQ (encode (Value::text (e_acute)),
             concat ({ u64_le (2), Bytes{ 0xc3, 0xa9 } }));
}

TEST (Encoder, ByteSequence)
{
  EXPECT_EQ (encode (Value::bytes ({ 0xde, 0xad })),
             concat ({ u64_le (2), Bytes{ 0xde, 0xad } }));
  // Same payload as text encodes identically
  EXPECT_EQ (encode (Value::bytes ({ 'h', 'i' })), encode (Value::text ("hi")));
}

TEST (Encoder, OrderedSequenceKeepsOrder)
{
  Value forward = Value::sequence (
      { Value::unsigned_integer (1), Value::boolean (true) });
  Value backward = Value::sequence (
      { Value::boolean (true), Value::unsigned_integer (1) });

  EXPECT_EQ (encode (forward),
             concat ({ u64_le (2), u64_le (1), Bytes{ 0x01 } }));
  EXPECT_NE (encode (forward), encode (backward));
  EXPECT_EQ (encode (Value::sequence ({})), u64_le (0));
}

TEST (Encoder, NestedSequence)
{
  Value nested = Value::sequence (
      { Value::sequence ({ Value::text ("x") }), Value::sequence ({}) });
  EXPECT_EQ (encode (nested),
             concat ({ u64_le (2), u64_le (1), u64_le (1), Bytes{ 'x' },
                       u64_le (0) }));
}

TEST (Encoder, MappingSortsKeysAndDropsThem)
{
  Value ab = Value::mapping ({ { "a", Value::unsigned_integer (1) },
                               { "b", Value::unsigned_integer (2) } });
  Value ba = Value::mapping ({ { "b", Value::unsigned_integer (2) },
                               { "a", Value::unsigned_integer (1) } });

  EXPECT_EQ (encode (ab), concat ({ u64_le (1), u64_le (2) }));
  EXPECT_EQ (encode (ab), encode (ba));
  EXPECT_EQ (move_compatible_hash (ab),
             "0c730b69905c5ef7a4ca5269f72365400bde2dd2c04eaf9bbb3d1c4a265a0131");
}

// Keys carry no bytes: different keys with the same sorted values collide.
// Matches contracts whose struct fields are declared alphabetically only.
TEST (Encoder, MappingKeysAreNotEncoded)
{
  Value first = Value::mapping ({ { "x", Value::boolean (true) },
                                  { "y", Value::boolean (false) } });
  Value second = Value::mapping ({ { "alpha", Value::boolean (true) },
                                   { "beta", Value::boolean (false) } });
  EXPECT_EQ (encode (first), encode (second));
  EXPECT_TRUE (encode (Value::mapping ({})).empty ());
}

TEST (Encoder, MappingSortIsBytewise)
{
  // "Z" (0x5a) < "a" (0x61) < "\xc3\xa9" (UTF-8 e-acute)
  Value m = Value::mapping ({ { "\xc3\xa9", Value::unsigned_integer (3) },
                              { "a", Value::unsigned_integer (2) },
                              { "Z", Value::unsigned_integer (1) } });
  EXPECT_EQ (encode (m), concat ({ u64_le (1), u64_le (2), u64_le (3) }));
}

TEST (Encoder, DuplicateMappingKeysRejected)
{
  Value dup = Value::mapping ({ { "k", Value::boolean (true) },
                                { "k", Value::boolean (false) } });
  EXPECT_EQ (error_kind_of ([&dup] { encode (dup); }),
             ErrorKind::InvalidArgument);
}

TEST (Encoder, Deterministic)
{
  Value v = Value::mapping (
      { { "amount", Value::unsigned_integer (1000) },
        { "memo", Value::text ("coffee") },
        { "tags", Value::sequence ({ Value::text ("a"), Value::text ("b") }) },
        { "paid", Value::boolean (false) } });
  Value copy = v;
  EXPECT_EQ (v, copy);
  EXPECT_EQ (encode (v), encode (v));
  EXPECT_EQ (encode (v), encode (copy));
  EXPECT_EQ (move_compatible_hash (v), move_compatible_hash (copy));
}

TEST (Encoder, MoveCompatibleHashVectors)
{
  EXPECT_EQ (move_compatible_hash (Value::text ("")),
             "af5570f5a1810b7af78caf4bc70a660f0df51e42baf91d4de5b2328de0e83dfc");
  EXPECT_EQ (move_compatible_hash (Value::text ("hello")),
             "fe745503750fdbf3e6ef676d16d85ee0d63626c594222f7e991908bdffef7ac9");
  EXPECT_EQ (move_compatible_hash (Value::unsigned_integer (1000)),
             "921ac7f259f864606624eb7fc29124712ff65b425e9500a35dd32b71ddb9332c");
}

TEST (Encoder, FromJson)
{
  auto json = nlohmann::json::parse (
      R"({"b": [1, true, "x"], "a": {"n": 256}})");
  Value v = from_json (json);
  ASSERT_EQ (v.kind (), Value::Kind::KeyedMapping);

  // a -> {n: 256}, then b -> [1, true, "x"]
  EXPECT_EQ (encode (v),
             concat ({ u64_le (256), u64_le (3), u64_le (1), Bytes{ 0x01 },
                       u64_le (1), Bytes{ 'x' } }));
}

TEST (Encoder, FromJsonBinary)
{
  Value v = from_json (nlohmann::json::binary (Bytes{ 1, 2, 3 }));
  ASSERT_EQ (v.kind (), Value::Kind::ByteSequence);
  EXPECT_EQ (v.as_bytes (), (Bytes{ 1, 2, 3 }));
}

TEST (Encoder, FromJsonUnsupportedTypes)
{
  EXPECT_EQ (error_kind_of ([] { from_json (nlohmann::json ()); }),
             ErrorKind::UnsupportedType);
  EXPECT_EQ (error_kind_of ([] { from_json (nlohmann::json (1.5)); }),
             ErrorKind::UnsupportedType);
  EXPECT_EQ (error_kind_of ([] { from_json (nlohmann::json::parse ("[1, null]")); }),
             ErrorKind::UnsupportedType);
}

TEST (Encoder, ParseInputFallbacks)
{
  EXPECT_EQ (parse_input ("true"), Value::boolean (true));
  EXPECT_EQ (parse_input (" 42 \n"), Value::unsigned_integer (42));
  EXPECT_EQ (parse_input ("\"quoted\""), Value::text ("quoted"));
  EXPECT_EQ (parse_input ("hello world"), Value::text ("hello world"));
  EXPECT_EQ (parse_input ("+5"), Value::unsigned_integer (5));
  EXPECT_EQ (parse_input ("007"), Value::unsigned_integer (7));
  EXPECT_EQ (parse_input ("a.b"), Value::text ("a.b"));
  EXPECT_EQ (parse_input ("[\"a\", 1]"),
             Value::sequence ({ Value::text ("a"), Value::unsigned_integer (1) }));
}

TEST (Encoder, ParseInputRejectsFloats)
{
  EXPECT_EQ (error_kind_of ([] { parse_input ("3.14"); }),
             ErrorKind::UnsupportedType);
  EXPECT_EQ (error_kind_of ([] { parse_input ("00.5"); }),
             ErrorKind::UnsupportedType);
}

TEST (Encoder, ParseInputRejectsOverflow)
{
  EXPECT_EQ (parse_input ("18446744073709551615"),
             Value::unsigned_integer (UINT64_MAX));

  // Too wide for 64 bits: an integer error, not a float
  for (const char *text :
       { "18446744073709551616", "+18446744073709551616",
         "99999999999999999999999", "[18446744073709551616]",
         "{\"amount\": 99999999999999999999999}", "-18446744073709551617" })
    {
      EXPECT_EQ (error_kind_of ([text] { parse_input (text); }),
                 ErrorKind::InvalidArgument)
          << text;
    }
  EXPECT_EQ (error_kind_of ([] {
               parse_json_input ("[1, 18446744073709551616]");
             }),
             ErrorKind::InvalidArgument);

  // Exponent and fraction forms stay floats
  EXPECT_EQ (error_kind_of ([] { parse_input ("1e20"); }),
             ErrorKind::UnsupportedType);
  EXPECT_EQ (error_kind_of ([] { parse_input ("[18446744073709551616.0]"); }),
             ErrorKind::UnsupportedType);
}

TEST (Encoder, ParseInputFallsBackOnTrailingText)
{
  // Not JSON as a whole, so a leading number does not count
  EXPECT_EQ (parse_input ("-7 apples"), Value::text ("-7 apples"));
  EXPECT_EQ (parse_input ("[null"), Value::text ("[null"));
}

TEST (Encoder, ParseJsonInput)
{
  EXPECT_EQ (parse_json_input ("{\"a\": 1}"),
             Value::mapping ({ { "a", Value::unsigned_integer (1) } }));
  EXPECT_EQ (error_kind_of ([] { parse_json_input ("hello"); }),
             ErrorKind::ParseError);
  EXPECT_EQ (error_kind_of ([] { parse_json_input ("{\"a\": }"); }),
             ErrorKind::ParseError);
}

TEST (Encoder, Describe)
{
  EXPECT_EQ (describe (Value::boolean (true)), "Boolean(true)");
  EXPECT_EQ (describe (Value::unsigned_integer (9)), "UnsignedInteger(9)");
  EXPECT_EQ (describe (Value::text ("abc")), "Text(3)");
  EXPECT_EQ (describe (Value::sequence ({ Value::boolean (false) })),
             "OrderedSequence(1)");
  EXPECT_STREQ (to_string (Value::Kind::KeyedMapping), "KeyedMapping");
}
