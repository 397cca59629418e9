// SPDX-License-Identifier: MIT
// TinyPay Toolkit - Error Reporting
// Copyright (c) 2024-2026 TinyPay Contributors

#pragma once

#include <stdexcept>
#include <string>

namespace tinypay
{

/// Failure categories reported by the toolkit
enum class ErrorKind
{
  InvalidArgument, // negative integer, zero iterations, bad numeric field
  UnsupportedType, // value outside the encodable set
  ParseError       // malformed hex or JSON from the outside
};

/// Name of an error kind (e.g. "InvalidArgument")
const char *to_string (ErrorKind kind);

/// Exception thrown by every toolkit operation that can fail
class Error : public std::runtime_error
{
public:
  Error (ErrorKind kind, const std::string &message);

  ErrorKind
  kind () const
  {
    return kind_;
  }

private:
  ErrorKind kind_;
};

} // namespace tinypay
