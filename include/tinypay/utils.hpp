// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Utility Functions
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include "tinypay/config.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tinypay
{

/// Convert hexadecimal string to byte vector
/// @param hex Hexadecimal string, optionally "0x"-prefixed (e.g. "deadbeef")
/// @return Vector of decoded bytes
/// @throws Error{ParseError} on odd length or a non-hex character
std::vector<uint8_t> hex_to_bytes (std::string_view hex);

/// Convert byte array to hexadecimal string
/// @param data Pointer to byte data
/// @param len Number of bytes
/// @return Lowercase hexadecimal string
std::string bytes_to_hex (const uint8_t *data, size_t len);

/// Validate an externally supplied digest and return its canonical text
/// @param hex 64 hex characters, optionally "0x"-prefixed, any case
/// @return 64 lowercase hex characters without prefix
/// @throws Error{ParseError} if it is not hex or not 32 bytes long
std::string parse_digest_hex (std::string_view hex);

/// Remove a leading "0x" if present
std::string_view strip_hex_prefix (std::string_view hex);

/// Single SHA256 hash
/// @param data Input data
/// @param len Input length in bytes
/// @param hash Output 32-byte hash
void sha256 (const uint8_t *data, size_t len, uint8_t *hash);

/// SHA256 of text as the 32 raw digest bytes
std::array<uint8_t, constants::DIGEST_SIZE> sha256 (std::string_view text);

/// SHA256 of a byte buffer as lowercase hex (64 characters)
std::string sha256_hex (const uint8_t *data, size_t len);

/// SHA256 of text as lowercase hex
std::string sha256_hex (std::string_view text);

/// One chain step: SHA256 over the ASCII characters of a hex string
///
/// The input is hashed as text. "ab" contributes the two bytes 0x61 0x62,
/// not the decoded byte 0xab. Hashing the decoded digest instead gives a
/// different, incompatible chain.
///
/// @param hex_text Hex digest text (no prefix handling)
/// @return Lowercase hex digest
std::string hash_ascii_of_hex (std::string_view hex_text);

} // namespace tinypay
