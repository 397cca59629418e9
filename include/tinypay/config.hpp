// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Configuration
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include <cstddef>
#include <cstdint>

namespace tinypay
{

// Named constants
namespace constants
{
constexpr size_t DIGEST_SIZE = 32;
constexpr uint64_t DEFAULT_ITERATIONS = 1000;
constexpr uint64_t MAX_RESERVED_DIGESTS = 1 << 16;
constexpr uint64_t PREVIEW_STEPS = 3; // digests shown at each end of a chain
constexpr const char *HEX_PREFIX = "0x";
constexpr const char *VERSION = "1.0.0";
}

/// Rendering used for byte sequences on the command line
enum class OutputFormat
{
  List,   // [97, 100, 98, 54]
  Aptos,  // vector<u8>:[97,100,98,54]
  String, // raw characters
  Json    // [97, 100, 98, 54] as JSON
};

/// Type prefix of a contract-call byte parameter
enum class ParameterPrefix
{
  U8,      // u8:[...]
  VectorU8 // vector<u8>:[...]
};

/// Toolkit configuration
struct Config
{
  uint64_t iterations = constants::DEFAULT_ITERATIONS;
  OutputFormat format = OutputFormat::List;
  ParameterPrefix prefix = ParameterPrefix::U8;
  bool json_output = false;
  bool verbose = false;
};

} // namespace tinypay
