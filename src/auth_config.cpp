/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <spdlog/spdlog.h>

#include "auth_config.hpp"
#include "credentials.hpp"
#include "utils/string_utils.hpp"

namespace curlcred
{

//--------------------------------------------------------------------
const char * to_string( AuthType p_type ) noexcept
{
  switch ( p_type )
  {
  case AuthType::none:   return "none";
  case AuthType::bearer: return "bearer";
  case AuthType::basic:  return "basic";
  case AuthType::custom: return "custom";
  default:               return "unknown";
  }
}

//--------------------------------------------------------------------
// NOLINTBEGIN(readability-misleading-indentation)
bool parse_auth_type( std::string_view p_text, AuthType & p_type )
{
       if ( p_text == "none"   ) p_type = AuthType::none;
  else if ( p_text == "bearer" ) p_type = AuthType::bearer;
  else if ( p_text == "basic"  ) p_type = AuthType::basic;
  else if ( p_text == "custom" ) p_type = AuthType::custom;
  else
      return false;  // unhandled type
  //
  return true;
}
// NOLINTEND(readability-misleading-indentation)

//--------------------------------------------------------------------
// Expect a CSKV list of sources. Example:
//   bearer=abc123,headers_file=/etc/downloader/headers.txt
// NOLINTBEGIN(readability-misleading-indentation)
bool AuthSources::set( const std::string & p_cskv )
{
  return parse_cskv(
    p_cskv,
    [ this ]( std::string_view key, std::string_view value )
    {
           if ( key == "type"         ) type         = value;
      else if ( key == "bearer"       ) bearer       = value;
      else if ( key == "basic"        ) basic        = value;
      else if ( key == "header"       ) header       = value;
      else if ( key == "headers_file" ) headers_file = value;
      else if ( key == "cookies_file" ) cookies_file = value;
      else if ( key == "cookies"      ) cookies      = value;
      else if ( key == "user_agent"   ) user_agent   = value;
      else
          return false;  // unhandled key
      //
      return true;
    } );
}
// NOLINTEND(readability-misleading-indentation)

//--------------------------------------------------------------------
// Reset all sources to unset
void AuthSources::set_default()
{
  type        .clear();  // inferred from the other sources
  bearer      .clear();  // bearer token
  basic       .clear();  // username:password
  header      .clear();  // Authorization header value
  headers_file.clear();  // path to the headers file
  cookies_file.clear();  // path to the cookies file
  cookies     .clear();  // inline cookies
  user_agent  .clear();  // User-Agent header value
}

//--------------------------------------------------------------------
// Sources are merged in a fixed order, the later wins for a same name:
//   header < headers file < user agent, whatever the case of the names
//   cookies file < inline cookies
status build_auth_configuration( const AuthSources & p_sources, AuthConfiguration & p_config )
{
  int primaries = ( p_sources.bearer.empty() ? 0 : 1 ) +
                  ( p_sources.basic .empty() ? 0 : 1 ) +
                  ( p_sources.header.empty() ? 0 : 1 );
  //
  if ( primaries > 1 )
    return status::failure( c_error_authentication_validation,
                            "multiple authentication methods specified (use only one of: bearer, basic, header)" );
  //
  AuthType forced_type = AuthType::none;
  if ( ! p_sources.type.empty() && ! parse_auth_type( p_sources.type, forced_type ) )
    return status::failure( c_error_authentication_validation,
                            "unsupported authentication type: " + p_sources.type );
  //
  AuthConfiguration config;
  //
  if ( ! p_sources.bearer.empty() )
  {
    config.type  = AuthType::bearer;
    config.token = p_sources.bearer;
  }
  else if ( ! p_sources.basic.empty() )
  {
    config.type = AuthType::basic;
    //
    auto result = parse_basic_auth_string( p_sources.basic, config.username, config.password );
    if ( ! result.ok() )
      return result;
  }
  else if ( ! p_sources.header.empty() )
  {
    config.type                       = AuthType::custom;
    config.headers[ "Authorization" ] = p_sources.header;
  }
  //
  if ( ! p_sources.headers_file.empty() )
  {
    key_values headers;
    //
    auto result = parse_headers_file( p_sources.headers_file, headers );
    if ( ! result.ok() )
      return result;
    //
    merge_headers( config.headers, headers );
  }
  //
  if ( ! p_sources.user_agent.empty() )
    merge_headers( config.headers, { { "User-Agent", p_sources.user_agent } } );
  //
  if ( ! p_sources.cookies_file.empty() )
  {
    key_values cookies;
    //
    auto result = parse_cookies_file( p_sources.cookies_file, cookies );
    if ( ! result.ok() )
      return result;
    //
    merge_key_values( config.cookies, cookies );
  }
  //
  if ( ! p_sources.cookies.empty() )
    merge_key_values( config.cookies, parse_cookie_string( p_sources.cookies ) );
  //
  if ( ! p_sources.type.empty() )
    config.type = forced_type; // checked against the other fields by AuthProvider
  else if ( config.type == AuthType::none && ( ! config.headers.empty() || ! config.cookies.empty() ) )
    config.type = AuthType::custom;
  //
  spdlog::debug( "authentication configuration: type {}, {} header(s), {} cookie(s)",
                 to_string( config.type ), config.headers.size(), config.cookies.size() );
  //
  p_config = std::move( config );
  return status::success();
}

} // namespace curlcred
