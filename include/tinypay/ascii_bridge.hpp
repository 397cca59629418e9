// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Hex/ASCII Bridge and Byte Rendering
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include "tinypay/config.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tinypay
{

/// Convert hex text to the ASCII codes of its characters
///
/// This is NOT hex decoding: "ab" becomes {97, 98}, not {0xab}. A leading
/// "0x" is dropped; every other character is copied as its code point with
/// no validity check, so the output has one byte per remaining character.
/// Callers are expected to pass well-formed hex (chain digests always are).
std::vector<uint8_t> hex_to_ascii_bytes (std::string_view hex_text);

/// Render bytes as two lowercase hex digits each ({72, 105} -> "4869")
///
/// Only undoes hex_to_ascii_bytes when the bytes are themselves ASCII codes
/// of hex digit characters.
std::string ascii_bytes_to_hex (const std::vector<uint8_t> &bytes);

/// Interpret each byte as one character ({72, 105} -> "Hi")
std::string ascii_bytes_to_string (const std::vector<uint8_t> &bytes);

/// Decimal list with spaces: "[97, 100, 98, 54]"
std::string format_byte_list (const std::vector<uint8_t> &bytes);

/// JSON array with ", " separators: "[97, 100, 98, 54]"
std::string format_json_array (const std::vector<uint8_t> &bytes);

/// Contract-call parameter: "u8:[97,100]" or "vector<u8>:[97,100]"
std::string format_cli_parameter (const std::vector<uint8_t> &bytes,
                                  ParameterPrefix prefix = ParameterPrefix::U8);

/// Render bytes in one of the command-line output formats
std::string format_bytes (const std::vector<uint8_t> &bytes,
                          OutputFormat format);

/// Parse "72, 101,108" into bytes
/// @throws Error{ParseError} on an empty or non-numeric field
/// @throws Error{InvalidArgument} on a value above 255
std::vector<uint8_t> parse_byte_list (std::string_view text);

} // namespace tinypay
