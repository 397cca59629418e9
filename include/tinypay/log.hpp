// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Logging
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include <string>

namespace tinypay
{

enum class LogLevel : int
{
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3
};

/// Set global logging threshold (default Info)
void set_log_level (LogLevel level) noexcept;

LogLevel get_log_level () noexcept;

/// Write one line. Warn and Error go to stderr, the rest to stdout.
/// Never throws.
void log (LogLevel level, const std::string &message) noexcept;

} // namespace tinypay
