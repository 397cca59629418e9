// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Hash Chain
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tinypay
{

/// Called once per chain step with the step index and its hex digest
using ChainObserver = std::function<void (uint64_t, const std::string &)>;

/// Ordered digests of an iterated SHA256 chain
///
///   digest[0] = SHA256(seed)
///   digest[i] = SHA256(ascii(digest[i-1]))   for i > 0
///
/// Every digest is kept as lowercase hex text. The next step hashes that
/// text, never the 32 raw bytes it represents.
class Chain
{
public:
  Chain (std::string seed, std::vector<std::string> digests);

  size_t
  size () const
  {
    return digests_.size ();
  }

  const std::string &
  operator[] (size_t index) const
  {
    return digests_[index];
  }

  const std::string &
  seed () const
  {
    return seed_;
  }

  const std::vector<std::string> &
  digests () const
  {
    return digests_;
  }

  /// Final digest, the public commitment
  const std::string &tail_commitment () const;

  /// Second-to-last digest, or the seed text for a one-step chain
  const std::string &one_time_value () const;

private:
  std::string seed_;
  std::vector<std::string> digests_;
};

/// Run the hash chain
/// @param seed Initial input, hashed as-is
/// @param iterations Number of digests to produce (>= 1)
/// @param observer Optional per-step callback
/// @return Chain of exactly `iterations` digests
/// @throws Error{InvalidArgument} if iterations is zero
Chain run_chain (std::string_view seed, uint64_t iterations,
                 const ChainObserver &observer = nullptr);

/// Check that a tail commitment is one chain step after a one-time value
///
/// Hashes the ASCII text of `one_time_value_hex` and compares the hex
/// result with `tail_hex`. A mismatch is a normal result, not an error.
bool verify (std::string_view one_time_value_hex, std::string_view tail_hex);

} // namespace tinypay
