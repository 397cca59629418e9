// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Command-Line Front End
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/ascii_bridge.hpp"
#include "tinypay/config.hpp"
#include "tinypay/encoder.hpp"
#include "tinypay/error.hpp"
#include "tinypay/hash_chain.hpp"
#include "tinypay/log.hpp"
#include "tinypay/utils.hpp"
#include "tinypay/workflow.hpp"

#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using tinypay::LogLevel;

static void
usage (const char *argv0)
{
  std::cerr
      << "TinyPay Toolkit " << tinypay::constants::VERSION << "\n"
      << "Usage:\n"
         "  "
      << argv0
      << " workflow <seed> [-n N] [--json-output] [--verbose]\n"
         "  "
      << argv0
      << " ascii <hex> [--format list|aptos|string|json]\n"
         "  "
      << argv0
      << " ascii --reverse <b0,b1,...>\n"
         "  "
      << argv0
      << " hash [<data>] [--json|--string] [--keep-newline] [--debug]\n"
         "  "
      << argv0 << " verify <opt_hex> <tail_hex>\n";
}

static void
info (const std::string &line)
{
  tinypay::log (LogLevel::Info, line);
}

// Parse a positive decimal iteration count
static uint64_t
parse_iterations (const std::string &text)
{
  if (text.empty ()
      || text.find_first_not_of ("0123456789") != std::string::npos)
    {
      throw tinypay::Error (tinypay::ErrorKind::InvalidArgument,
                            "iteration count is not a number: " + text);
    }
  try
    {
      return std::stoull (text);
    }
  catch (const std::out_of_range &)
    {
      throw tinypay::Error (tinypay::ErrorKind::InvalidArgument,
                            "iteration count out of range: " + text);
    }
}

static int
run_workflow (const std::vector<std::string> &args)
{
  tinypay::Config cfg;
  std::string seed;
  bool have_seed = false;

  for (size_t i = 0; i < args.size (); ++i)
    {
      const std::string &a = args[i];
      if ((a == "-n" || a == "--iterations") && i + 1 < args.size ())
        cfg.iterations = parse_iterations (args[++i]);
      else if (a == "--json-output")
        cfg.json_output = true;
      else if (a == "--verbose")
        cfg.verbose = true;
      else if (!have_seed)
        {
          seed = a;
          have_seed = true;
        }
      else
        return 2;
    }
  if (!have_seed)
    return 2;

  if (cfg.verbose)
    tinypay::set_log_level (LogLevel::Debug);

  const uint64_t n = cfg.iterations;
  const uint64_t k = tinypay::constants::PREVIEW_STEPS;

  info ("=== TinyPay Payment Workflow ===");
  info ("Initial data: " + seed);
  info ("Iterations: " + std::to_string (n));
  info ("");

  auto params = tinypay::prepare_payment (
      seed, n, [n, k] (uint64_t i, const std::string &digest) {
        // First and last few steps only
        if (i < k || i + k >= n)
          info ("Iteration " + std::to_string (i + 1) + ": " + digest);
        else if (i == k)
          info ("...");
      });

  const auto &opt = params.opt_ascii_bytes;
  const auto &tail = params.tail_ascii_bytes;

  info ("");
  info ("=== Results ===");
  info ("opt (hex): " + params.opt_hex);
  info ("tail (hex): " + params.tail_hex);
  info ("opt (ASCII bytes): " + tinypay::format_byte_list (opt));
  info ("tail (ASCII bytes): " + tinypay::format_byte_list (tail));
  info ("");
  info ("=== Contract Call Parameters ===");
  info ("opt parameter: " + tinypay::format_cli_parameter (opt, cfg.prefix));
  info ("tail parameter: " + tinypay::format_cli_parameter (tail, cfg.prefix));
  info ("");
  info ("=== Verification ===");
  info ("SHA256(opt_hex as ASCII): "
        + tinypay::hash_ascii_of_hex (params.opt_hex));
  info ("Expected (tail_hex): " + params.tail_hex);
  info (std::string ("Verification: ")
        + (params.verification_ok ? "PASS" : "FAIL"));

  if (cfg.json_output)
    {
      info ("");
      info ("=== JSON Output ===");
      info (tinypay::to_json_text (params, 2));
    }
  return 0;
}

static int
run_ascii (const std::vector<std::string> &args)
{
  tinypay::Config cfg;
  bool reverse = false;
  std::string input;
  bool have_input = false;

  for (size_t i = 0; i < args.size (); ++i)
    {
      const std::string &a = args[i];
      if (a == "--format" && i + 1 < args.size ())
        {
          const std::string &f = args[++i];
          if (f == "list")
            cfg.format = tinypay::OutputFormat::List;
          else if (f == "aptos")
            cfg.format = tinypay::OutputFormat::Aptos;
          else if (f == "string")
            cfg.format = tinypay::OutputFormat::String;
          else if (f == "json")
            cfg.format = tinypay::OutputFormat::Json;
          else
            return 2;
        }
      else if (a == "--reverse")
        reverse = true;
      else if (!have_input)
        {
          input = a;
          have_input = true;
        }
      else
        return 2;
    }
  if (!have_input)
    return 2;

  if (reverse)
    {
      auto bytes = tinypay::parse_byte_list (input);
      std::cout << "ASCII bytes: " << tinypay::format_byte_list (bytes) << "\n"
                << "Hex string: " << tinypay::ascii_bytes_to_hex (bytes) << "\n"
                << "String: " << tinypay::ascii_bytes_to_string (bytes)
                << "\n";
      return 0;
    }

  std::cout << tinypay::format_bytes (tinypay::hex_to_ascii_bytes (input),
                                      cfg.format)
            << "\n";
  return 0;
}

static int
run_hash (const std::vector<std::string> &args)
{
  bool force_json = false;
  bool force_string = false;
  bool keep_newline = false;
  bool debug = false;
  std::string input;
  bool have_input = false;

  for (const auto &a : args)
    {
      if (a == "--json")
        force_json = true;
      else if (a == "--string")
        force_string = true;
      else if (a == "--keep-newline")
        keep_newline = true;
      else if (a == "--debug")
        debug = true;
      else if (!have_input)
        {
          input = a;
          have_input = true;
        }
      else
        return 2;
    }

  if (!have_input)
    {
      input.assign (std::istreambuf_iterator<char> (std::cin),
                    std::istreambuf_iterator<char> ());
      if (!keep_newline && !input.empty () && input.back () == '\n')
        input.pop_back ();
    }

  tinypay::Value value
      = force_string ? tinypay::Value::text (input)
        : force_json ? tinypay::parse_json_input (input)
                     : tinypay::parse_input (input);

  std::string hash = tinypay::move_compatible_hash (value);

  if (debug)
    {
      auto bytes = tinypay::encode (value);
      std::cerr << "value: " << tinypay::describe (value) << "\n"
                << "canonical bytes: "
                << tinypay::bytes_to_hex (bytes.data (), bytes.size ()) << "\n"
                << "canonical length: " << bytes.size () << "\n"
                << "SHA256: " << hash << "\n"
                << "---\n";
    }

  std::cout << hash << "\n";
  return 0;
}

// Exit 0 when tail is one chain step after opt, 1 otherwise
static int
run_verify (const std::vector<std::string> &args)
{
  if (args.size () != 2)
    return 2;

  std::string opt = tinypay::parse_digest_hex (args[0]);
  std::string tail = tinypay::parse_digest_hex (args[1]);
  bool ok = tinypay::verify (opt, tail);

  info ("SHA256(opt_hex as ASCII): " + tinypay::hash_ascii_of_hex (opt));
  info ("Expected (tail_hex): " + tail);
  info (std::string ("Verification: ") + (ok ? "PASS" : "FAIL"));
  return ok ? 0 : 1;
}

int
main (int argc, char **argv)
{
  if (argc < 2)
    {
      usage (argv[0]);
      return 2;
    }

  std::string command = argv[1];
  std::vector<std::string> args (argv + 2, argv + argc);

  int rc = 2;
  try
    {
      if (command == "workflow")
        rc = run_workflow (args);
      else if (command == "ascii")
        rc = run_ascii (args);
      else if (command == "hash")
        rc = run_hash (args);
      else if (command == "verify")
        rc = run_verify (args);
      else if (command == "--version")
        {
          std::cout << tinypay::constants::VERSION << "\n";
          rc = 0;
        }
    }
  catch (const tinypay::Error &e)
    {
      tinypay::log (LogLevel::Error,
           std::string (tinypay::to_string (e.kind ())) + ": " + e.what ());
      return 1;
    }
  catch (const std::exception &e)
    {
      tinypay::log (LogLevel::Error, e.what ());
      return 1;
    }

  if (rc == 2)
    usage (argv[0]);
  return rc;
}
