// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Utility Functions Implementation
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/error.hpp"
#include "tinypay/utils.hpp"
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace tinypay
{

namespace
{
int
hex_value (char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
}

std::string_view
strip_hex_prefix (std::string_view hex)
{
  if (hex.substr (0, 2) == constants::HEX_PREFIX)
    {
      hex.remove_prefix (2);
    }
  return hex;
}

std::vector<uint8_t>
hex_to_bytes (std::string_view hex)
{
  hex = strip_hex_prefix (hex);
  if (hex.length () % 2 != 0)
    {
      throw Error (ErrorKind::ParseError,
                   "hex string has odd length " + std::to_string (hex.length ()));
    }

  std::vector<uint8_t> bytes;
  bytes.reserve (hex.length () / 2);

  for (size_t i = 0; i < hex.length (); i += 2)
    {
      int hi = hex_value (hex[i]);
      int lo = hex_value (hex[i + 1]);
      if (hi < 0 || lo < 0)
        {
          throw Error (ErrorKind::ParseError,
                       "invalid hex character at offset "
                           + std::to_string (hi < 0 ? i : i + 1));
        }
      bytes.push_back (static_cast<uint8_t> ((hi << 4) | lo));
    }
  return bytes;
}

std::string
parse_digest_hex (std::string_view hex)
{
  auto bytes = hex_to_bytes (hex);
  if (bytes.size () != constants::DIGEST_SIZE)
    {
      throw Error (ErrorKind::ParseError,
                   "digest must be " + std::to_string (constants::DIGEST_SIZE)
                       + " bytes, got " + std::to_string (bytes.size ()));
    }
  return bytes_to_hex (bytes.data (), bytes.size ());
}

std::string
bytes_to_hex (const uint8_t *data, size_t len)
{
  std::ostringstream ss;
  ss << std::hex << std::setfill ('0');
  for (size_t i = 0; i < len; ++i)
    {
      ss << std::setw (2) << static_cast<int> (data[i]);
    }
  return ss.str ();
}

void
sha256 (const uint8_t *data, size_t len, uint8_t *hash)
{
  SHA256 (data, len, hash);
}

std::array<uint8_t, constants::DIGEST_SIZE>
sha256 (std::string_view text)
{
  std::array<uint8_t, constants::DIGEST_SIZE> hash;
  sha256 (reinterpret_cast<const uint8_t *> (text.data ()), text.size (),
          hash.data ());
  return hash;
}

std::string
sha256_hex (const uint8_t *data, size_t len)
{
  uint8_t hash[constants::DIGEST_SIZE];
  sha256 (data, len, hash);
  return bytes_to_hex (hash, constants::DIGEST_SIZE);
}

std::string
sha256_hex (std::string_view text)
{
  return sha256_hex (reinterpret_cast<const uint8_t *> (text.data ()),
                     text.size ());
}

std::string
hash_ascii_of_hex (std::string_view hex_text)
{
  // Each hex character is one input byte
  return sha256_hex (hex_text);
}

} // namespace tinypay
