// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Hex/ASCII Bridge Implementation
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/ascii_bridge.hpp"
#include "tinypay/error.hpp"
#include "tinypay/utils.hpp"
#include <sstream>

namespace tinypay
{

namespace
{
std::string
join_decimal (const std::vector<uint8_t> &bytes, const char *separator)
{
  std::ostringstream ss;
  for (size_t i = 0; i < bytes.size (); ++i)
    {
      if (i > 0)
        ss << separator;
      ss << static_cast<int> (bytes[i]);
    }
  return ss.str ();
}

std::string_view
trim (std::string_view s)
{
  const char *ws = " \t\r\n";
  size_t begin = s.find_first_not_of (ws);
  if (begin == std::string_view::npos)
    return {};
  size_t end = s.find_last_not_of (ws);
  return s.substr (begin, end - begin + 1);
}
}

std::vector<uint8_t>
hex_to_ascii_bytes (std::string_view hex_text)
{
  hex_text = strip_hex_prefix (hex_text);

  std::vector<uint8_t> bytes;
  bytes.reserve (hex_text.size ());
  for (char c : hex_text)
    {
      bytes.push_back (static_cast<uint8_t> (c));
    }
  return bytes;
}

std::string
ascii_bytes_to_hex (const std::vector<uint8_t> &bytes)
{
  return bytes_to_hex (bytes.data (), bytes.size ());
}

std::string
ascii_bytes_to_string (const std::vector<uint8_t> &bytes)
{
  return std::string (bytes.begin (), bytes.end ());
}

std::string
format_byte_list (const std::vector<uint8_t> &bytes)
{
  return "[" + join_decimal (bytes, ", ") + "]";
}

std::string
format_json_array (const std::vector<uint8_t> &bytes)
{
  // ", " between items, as payment tooling writes JSON byte arrays
  return "[" + join_decimal (bytes, ", ") + "]";
}

std::string
format_cli_parameter (const std::vector<uint8_t> &bytes,
                      ParameterPrefix prefix)
{
  const char *type = (prefix == ParameterPrefix::VectorU8) ? "vector<u8>" : "u8";
  return std::string (type) + ":[" + join_decimal (bytes, ",") + "]";
}

std::string
format_bytes (const std::vector<uint8_t> &bytes, OutputFormat format)
{
  switch (format)
    {
    case OutputFormat::List:
      return format_byte_list (bytes);
    case OutputFormat::Aptos:
      return format_cli_parameter (bytes, ParameterPrefix::VectorU8);
    case OutputFormat::String:
      return ascii_bytes_to_string (bytes);
    case OutputFormat::Json:
      return format_json_array (bytes);
    }
  return format_byte_list (bytes);
}

std::vector<uint8_t>
parse_byte_list (std::string_view text)
{
  std::vector<uint8_t> bytes;

  size_t pos = 0;
  while (true)
    {
      size_t comma = text.find (',', pos);
      std::string_view field = trim (text.substr (
          pos, comma == std::string_view::npos ? std::string_view::npos
                                               : comma - pos));

      if (field.empty ())
        {
          throw Error (ErrorKind::ParseError, "empty byte value in list");
        }

      if (field.size () > 1 && field[0] == '-'
          && field.find_first_not_of ("0123456789", 1)
                 == std::string_view::npos)
        {
          throw Error (ErrorKind::InvalidArgument,
                       "byte value out of range: " + std::string (field));
        }

      unsigned long value = 0;
      for (char c : field)
        {
          if (c < '0' || c > '9')
            {
              throw Error (ErrorKind::ParseError,
                           "not a decimal byte value: " + std::string (field));
            }
          value = value * 10 + static_cast<unsigned long> (c - '0');
          if (value > 255)
            {
              throw Error (ErrorKind::InvalidArgument,
                           "byte value out of range: " + std::string (field));
            }
        }
      bytes.push_back (static_cast<uint8_t> (value));

      if (comma == std::string_view::npos)
        break;
      pos = comma + 1;
    }

  return bytes;
}

} // namespace tinypay
