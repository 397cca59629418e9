// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Payment Parameter Workflow
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include "tinypay/hash_chain.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tinypay
{

/// Everything the payment contract call needs from one chain
struct PaymentParameters
{
  uint64_t iterations = 0;
  std::string opt_hex;  // one-time value
  std::string tail_hex; // tail commitment
  std::vector<uint8_t> opt_ascii_bytes;
  std::vector<uint8_t> tail_ascii_bytes;
  bool verification_ok = false;
};

/// Derive contract parameters from a seed
///
/// Runs the chain, picks the one-time value and tail commitment, converts
/// both through the ASCII bridge and cross-checks them with verify().
/// For a single iteration the one-time value is the seed text itself.
/// A failed cross-check is reported in verification_ok, not thrown.
///
/// @throws Error{InvalidArgument} if iterations is zero
PaymentParameters prepare_payment (std::string_view seed, uint64_t iterations,
                                   const ChainObserver &observer = nullptr);

/// Machine-readable form of the parameters
nlohmann::json to_json (const PaymentParameters &params);

/// Serialized to_json() output
///
/// A seed that is not valid UTF-8 (possible as the one-time value of a
/// single-step chain) is written with U+FFFD replacement characters in the
/// text fields; the byte arrays keep the exact values.
///
/// @param indent Spaces per level, -1 for a single line
std::string to_json_text (const PaymentParameters &params, int indent = -1);

} // namespace tinypay
