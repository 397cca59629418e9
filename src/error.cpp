// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Error Reporting Implementation
// Copyright (c) 2024-2026 TinyPay Contributors

#include "tinypay/error.hpp"

namespace tinypay
{

const char *
to_string (ErrorKind kind)
{
  switch (kind)
    {
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::UnsupportedType:
      return "UnsupportedType";
    case ErrorKind::ParseError:
      return "ParseError";
    }
  return "Unknown";
}

Error::Error (ErrorKind kind, const std::string &message)
    : std::runtime_error (message), kind_ (kind)
{
}

} // namespace tinypay
