/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace curlcred
{

constexpr long c_success                          =   0;

constexpr long c_error_credentials_io             = -40; // credential file cannot be opened or read
constexpr long c_error_credentials_format         = -41; // line or string violates its grammar
constexpr long c_error_credentials_empty          = -42; // credential file yields no entry

constexpr long c_error_authentication_validation  = -50; // configuration inconsistent with its type
constexpr long c_error_authentication_apply       = -51; // failed to decorate a request

//--------------------------------------------------------------------
// Outcome of a fallible operation, the message is meant for the operator
struct status
{
  long        code    = c_success;
  std::string message;
  std::size_t line    = 0;  // 1-based offending line for file format errors
  //
  bool ok() const noexcept { return code == c_success; }
  //
  static status success() { return {}; }
  static status failure( long p_code, std::string p_message, std::size_t p_line = 0 )
  {
    return { p_code, std::move( p_message ), p_line };
  }
};

} // namespace curlcred
