/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <string>
#include <string_view>

#include "status.hpp"
#include "utils/map_utils.hpp"

namespace curlcred
{

enum class AuthType { none, bearer, basic, custom };

// Returns "none", "bearer", "basic", "custom" or "unknown"
const char * to_string( AuthType p_type ) noexcept;

// Converts the textual form of an authentication type. Returns false if unknown.
bool parse_auth_type( std::string_view p_text, AuthType & p_type );

//--------------------------------------------------------------------
// Description of the authentication strategy and its overlay headers
// and cookies. Fields must be consistent with the type, this is checked
// when building an AuthProvider from it.
struct AuthConfiguration
{
  AuthType    type = AuthType::none;
  std::string token;     // bearer only
  std::string username;  // basic only
  std::string password;  // basic only, may be empty
  key_values  headers;   // overlay headers, any type
  key_values  cookies;   // overlay cookies, any type
};

//--------------------------------------------------------------------
// The raw credential sources collected by the configuration loader
// (command line, configuration file, environment). Empty means unset.
struct AuthSources
{
  std::string type;          // forces the type: none, bearer, basic or custom
  std::string bearer;        // token, with or without the "Bearer " prefix
  std::string basic;         // "username" or "username:password"
  std::string header;        // raw Authorization header value
  std::string headers_file;  // path to a "Name: value" file
  std::string cookies_file;  // path to a "name=value" file
  std::string cookies;       // "name1=value1; name2=value2"
  std::string user_agent;
  //
  // Expect a CSKV list of sources. Example:
  //   bearer=abc123,headers_file=/etc/downloader/headers.txt
  // Available keys are:
  //   Name          Comment
  //   type          none, bearer, basic or custom
  //   bearer        bearer token
  //   basic         username:password
  //   header        Authorization header value
  //   headers_file  path to the headers file
  //   cookies_file  path to the cookies file
  //   cookies       inline cookies, name1=value1; name2=value2
  //   user_agent    User-Agent header value
  // Values cannot contain commas.
  bool set( const std::string & p_cskv );
  //
  // Reset all sources to unset
  void set_default();
};

// Assembles the configuration from the sources: at most one of bearer,
// basic and header can be used; files and inline strings are parsed and
// merged into the overlays, header names case insensitively. A configuration
// without primary credential but with overlays becomes custom, unless a type
// is given. An unknown type is a c_error_authentication_validation.
// On error p_config is left untouched.
status build_auth_configuration( const AuthSources & p_sources, AuthConfiguration & p_config );

} // namespace curlcred
