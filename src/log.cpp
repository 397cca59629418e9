// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Logging Implementation
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace tinypay
{

namespace
{
std::mutex g_log_mutex;
std::atomic<int> g_log_level{ static_cast<int> (LogLevel::Info) };

const char *
level_tag (LogLevel level)
{
  switch (level)
    {
    case LogLevel::Debug:
      return "[debug] ";
    case LogLevel::Info:
      return "";
    case LogLevel::Warn:
      return "[warn] ";
    case LogLevel::Error:
      return "[error] ";
    }
  return "";
}
}

void
set_log_level (LogLevel level) noexcept
{
  g_log_level.store (static_cast<int> (level));
}

LogLevel
get_log_level () noexcept
{
  return static_cast<LogLevel> (g_log_level.load ());
}

void
log (LogLevel level, const std::string &message) noexcept
{
  if (static_cast<int> (level) < g_log_level.load ())
    return;

  try
    {
      std::lock_guard<std::mutex> lock (g_log_mutex);
      std::ostream &out
          = (level >= LogLevel::Warn) ? std::cerr : std::cout;
      out << level_tag (level) << message << '\n';
      out.flush ();
    }
  catch (const std::exception &)
    {
      // Logging must not take the caller down
    }
}

} // namespace tinypay
