/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <memory>
#include <string>

#include "auth_config.hpp"
#include "request.hpp"
#include "status.hpp"
#include "utils/map_utils.hpp"

namespace curlcred
{

//--------------------------------------------------------------------
// Something that decorates outgoing requests with credentials.
// Implementations are immutable and used concurrently by all download
// workers, each one with its own Request.
class RequestDecorator
{
public:
  virtual ~RequestDecorator() = default;
  //
  // Adds credential headers and cookies to p_request
  virtual status apply( Request & p_request ) const = 0;
  //
  virtual AuthType get_type() const noexcept = 0;
};

//--------------------------------------------------------------------
// Decorates requests according to a validated AuthConfiguration.
// The configuration is copied when the provider is created and never
// modified afterward.
class AuthProvider final : public RequestDecorator
{
public:
  // Validates p_config against its type and creates the provider.
  // On error p_provider is left untouched. Requirements are:
  //   Type    Required
  //   none    nothing
  //   bearer  a token
  //   basic   a username, the password can be empty
  //   custom  at least one header or cookie
  // For all types, headers and cookies must be valid for HTTP (see
  // is_header_value...) and no two header names can differ only by case.
  static status create( const AuthConfiguration &               p_config,
                        std::shared_ptr< const AuthProvider > & p_provider );
  //
  // Applies in order:
  //  - the primary credential (Authorization header for bearer and basic)
  //  - the overlay headers, except Authorization if the request already has one
  //  - the overlay cookies
  // Stops at the first error, without reverting what was already applied.
  status apply( Request & p_request ) const override;
  //
  AuthType get_type() const noexcept override { return m_type; }
  //
private:
  explicit AuthProvider( const AuthConfiguration & p_config );
  //
  status apply_bearer ( Request & p_request ) const;
  status apply_basic  ( Request & p_request ) const;
  void   apply_headers( Request & p_request ) const;
  void   apply_cookies( Request & p_request ) const;
  //
  const AuthType    m_type;
  const std::string m_token;
  const std::string m_username;
  const std::string m_password;
  const key_values  m_headers;
  const key_values  m_cookies;
};

} // namespace curlcred
