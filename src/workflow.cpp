// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Payment Parameter Workflow Implementation
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/ascii_bridge.hpp"
#include "tinypay/log.hpp"
#include "tinypay/workflow.hpp"

namespace tinypay
{

PaymentParameters
prepare_payment (std::string_view seed, uint64_t iterations,
                 const ChainObserver &observer)
{
  Chain chain = run_chain (seed, iterations, observer);

  PaymentParameters params;
  params.iterations = iterations;
  params.opt_hex = chain.one_time_value ();
  params.tail_hex = chain.tail_commitment ();
  params.opt_ascii_bytes = hex_to_ascii_bytes (params.opt_hex);
  params.tail_ascii_bytes = hex_to_ascii_bytes (params.tail_hex);
  params.verification_ok = verify (params.opt_hex, params.tail_hex);

  if (!params.verification_ok)
    {
      log (LogLevel::Debug,
           "one-time value does not hash to the tail commitment");
    }

  return params;
}

nlohmann::json
to_json (const PaymentParameters &params)
{
  return { { "opt_hex", params.opt_hex },
           { "tail_hex", params.tail_hex },
           { "opt_ascii_bytes", params.opt_ascii_bytes },
           { "tail_ascii_bytes", params.tail_ascii_bytes },
           { "opt_json", format_json_array (params.opt_ascii_bytes) },
           { "tail_json", format_json_array (params.tail_ascii_bytes) },
           { "aptos_opt_format",
             format_cli_parameter (params.opt_ascii_bytes, ParameterPrefix::U8) },
           { "aptos_tail_format",
             format_cli_parameter (params.tail_ascii_bytes,
                                   ParameterPrefix::U8) },
           { "verification_ok", params.verification_ok } };
}

std::string
to_json_text (const PaymentParameters &params, int indent)
{
  return to_json (params).dump (indent, ' ', false,
                                nlohmann::json::error_handler_t::replace);
}

} // namespace tinypay
