/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <spdlog/spdlog.h>

#include "auth_provider.hpp"
#include "utils/curl_utils.hpp"
#include "utils/string_utils.hpp"

namespace curlcred
{

namespace
{
  const std::string c_authorization = "Authorization";

  //------------------------------------------------------------------
  // Overlays are sent as given: each entry must stay a single header or
  // cookie, and two header names differing only by case would make the
  // sent value depend on the map order.
  status validate_overlays( const AuthConfiguration & p_config )
  {
    key_values_ci names;
    //
    for ( const auto & [ name, value ] : p_config.headers )
    {
      if ( ! is_header_name( name ) || ! is_header_value( value ) )
        return status::failure( c_error_authentication_validation,
                                "invalid characters in header: " + name );
      //
      if ( ! names.emplace( name, value ).second )
        return status::failure( c_error_authentication_validation,
                                "header defined twice with different cases: " + name );
    }
    //
    for ( const auto & [ name, value ] : p_config.cookies )
      if ( ! is_cookie_name( name ) || ! is_cookie_value( value ) )
        return status::failure( c_error_authentication_validation,
                                "invalid characters in cookie: " + name );
    //
    return status::success();
  }

  //------------------------------------------------------------------
  // Checks that the populated fields are consistent with the type
  status validate( const AuthConfiguration & p_config )
  {
    switch ( p_config.type )
    {
    case AuthType::none:
      break;
    case AuthType::bearer:
      if ( p_config.token.empty() )
        return status::failure( c_error_authentication_validation,
                                "token is required for bearer authentication" );
      if ( ! is_header_value( p_config.token ) )
        return status::failure( c_error_authentication_validation,
                                "invalid characters in bearer token" );
      break;
    case AuthType::basic:
      if ( p_config.username.empty() )
        return status::failure( c_error_authentication_validation,
                                "username is required for basic authentication" );
      if ( p_config.username.find( ':' ) != std::string::npos ) // RFC 7617
        return status::failure( c_error_authentication_validation,
                                "username cannot contain a colon for basic authentication" );
      break;
    case AuthType::custom:
      if ( p_config.headers.empty() && p_config.cookies.empty() )
        return status::failure( c_error_authentication_validation,
                                "headers or cookies required for custom authentication" );
      break;
    default:
      return status::failure( c_error_authentication_validation,
                              "unsupported authentication type: " +
                                std::to_string( static_cast< int >( p_config.type ) ) );
    }
    //
    return validate_overlays( p_config );
  }

} // namespace

//--------------------------------------------------------------------
AuthProvider::AuthProvider( const AuthConfiguration & p_config ) :
  m_type    ( p_config.type     ),
  m_token   ( p_config.token    ),
  m_username( p_config.username ),
  m_password( p_config.password ),
  m_headers ( p_config.headers  ),
  m_cookies ( p_config.cookies  )
{
}

//--------------------------------------------------------------------
// The constructor is private, std::make_shared cannot be used
status AuthProvider::create( const AuthConfiguration &               p_config,
                             std::shared_ptr< const AuthProvider > & p_provider )
{
  auto result = validate( p_config );
  if ( ! result.ok() )
  {
    spdlog::warn( "invalid authentication configuration: {}", result.message );
    return result;
  }
  //
  p_provider = std::shared_ptr< const AuthProvider >( new AuthProvider( p_config ) ); // throw on memory error
  //
  spdlog::info( "authentication enabled: type {}, {} header(s), {} cookie(s)",
                to_string( p_config.type ), p_config.headers.size(), p_config.cookies.size() );
  //
  return status::success();
}

//--------------------------------------------------------------------
// Fixed order: primary credential, headers, cookies
status AuthProvider::apply( Request & p_request ) const
{
  status result;
  //
  switch ( m_type )
  {
  case AuthType::bearer:
    result = apply_bearer( p_request );
    break;
  case AuthType::basic:
    result = apply_basic( p_request );
    break;
  case AuthType::none:
  case AuthType::custom:
    break;  // no primary credential
  default:
    result = status::failure( c_error_authentication_apply, "unsupported authentication type" );
    break;
  }
  //
  if ( ! result.ok() )
    return result;
  //
  apply_headers( p_request );
  apply_cookies( p_request );
  //
  return status::success();
}

//--------------------------------------------------------------------
// The token can be given with or without its "Bearer " prefix
status AuthProvider::apply_bearer( Request & p_request ) const
{
  if ( m_token.empty() )
    return status::failure( c_error_authentication_apply, "bearer token is empty" );
  //
  p_request.set_header( c_authorization,
                        starts_with_ascii_ci( m_token, "bearer " ) ? m_token : "Bearer " + m_token );
  //
  return status::success();
}

//--------------------------------------------------------------------
// The password can be empty, some servers allow it
status AuthProvider::apply_basic( Request & p_request ) const
{
  if ( m_username.empty() )
    return status::failure( c_error_authentication_apply, "username is required for basic auth" );
  //
  p_request.set_header( c_authorization, "Basic " + base64_encode( m_username + ":" + m_password ) );
  //
  return status::success();
}

//--------------------------------------------------------------------
// The primary credential has precedence over an Authorization overlay header
void AuthProvider::apply_headers( Request & p_request ) const
{
  for ( const auto & [ name, value ] : m_headers )
  {
    if ( equal_ascii_ci( name, c_authorization ) && p_request.has_header( c_authorization ) )
      continue;
    //
    p_request.set_header( name, value );
  }
}

//--------------------------------------------------------------------
void AuthProvider::apply_cookies( Request & p_request ) const
{
  for ( const auto & [ name, value ] : m_cookies )
    p_request.add_cookie( name, value );
}

} // namespace curlcred
