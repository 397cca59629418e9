// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Hash Chain Implementation
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/config.hpp"
#include "tinypay/error.hpp"
#include "tinypay/hash_chain.hpp"
#include "tinypay/log.hpp"
#include "tinypay/utils.hpp"
#include <algorithm>
#include <utility>

namespace tinypay
{

Chain::Chain (std::string seed, std::vector<std::string> digests)
    : seed_ (std::move (seed)), digests_ (std::move (digests))
{
  if (digests_.empty ())
    {
      throw Error (ErrorKind::InvalidArgument,
                   "hash chain must contain at least one digest");
    }
}

const std::string &
Chain::tail_commitment () const
{
  return digests_.back ();
}

const std::string &
Chain::one_time_value () const
{
  // A one-step chain has no predecessor digest; the seed stands in
  if (digests_.size () < 2)
    {
      return seed_;
    }
  return digests_[digests_.size () - 2];
}

Chain
run_chain (std::string_view seed, uint64_t iterations,
           const ChainObserver &observer)
{
  if (iterations == 0)
    {
      throw Error (ErrorKind::InvalidArgument,
                   "iteration count must be at least 1");
    }

  std::vector<std::string> digests;
  digests.reserve (static_cast<size_t> (
      std::min (iterations, constants::MAX_RESERVED_DIGESTS)));

  // Step 0 hashes the seed, later steps hash the previous hex text
  digests.push_back (sha256_hex (seed));
  if (observer)
    observer (0, digests.back ());

  for (uint64_t i = 1; i < iterations; ++i)
    {
      digests.push_back (hash_ascii_of_hex (digests.back ()));
      if (observer)
        observer (i, digests.back ());
    }

  log (LogLevel::Debug, "hash chain: " + std::to_string (iterations)
                            + " steps, tail " + digests.back ());

  return Chain (std::string (seed), std::move (digests));
}

bool
verify (std::string_view one_time_value_hex, std::string_view tail_hex)
{
  return hash_ascii_of_hex (one_time_value_hex) == tail_hex;
}

} // namespace tinypay
