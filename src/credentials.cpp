/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <fstream>
#include <utility>
#include <spdlog/spdlog.h>

#include "credentials.hpp"
#include "utils/string_utils.hpp"

namespace curlcred
{

namespace
{
  // Grammar of a credential file
  struct file_grammar
  {
    const char * kind;       // "header" or "cookie", used in messages
    char         delimiter;  // between name and value
    const char * expected;   // expected line layout, used in messages
  };

  constexpr file_grammar c_headers_grammar = { "header", ':', "'Name: value'" };
  constexpr file_grammar c_cookies_grammar = { "cookie", '=', "'name=value'"  };

  //------------------------------------------------------------------
  // Reads p_path line by line and fills p_entries only if the whole file is valid
  status parse_file( const std::string &  p_path,
                     const file_grammar & p_grammar,
                     key_values &         p_entries )
  {
    std::ifstream file( p_path );
    if ( ! file.is_open() )
      return status::failure( c_error_credentials_io,
                              std::string( "failed to open " ) + p_grammar.kind + "s file: " + p_path );
    //
    key_values  entries;
    std::string raw_line;
    std::size_t line_number = 0;
    //
    while ( std::getline( file, raw_line ) )
    {
      line_number++;
      auto line = trim( raw_line );
      //
      if ( line.empty() || line.front() == '#' ) // blank or comment
        continue;
      //
      std::string_view name, value;
      if ( ! split_first( line, p_grammar.delimiter, name, value ) )
        return status::failure( c_error_credentials_format,
                                "invalid " + std::string( p_grammar.kind ) + " format at line " +
                                  std::to_string( line_number ) + ": " + std::string( line ) +
                                  " (expected " + p_grammar.expected + ")",
                                line_number );
      //
      if ( name.empty() )
        return status::failure( c_error_credentials_format,
                                "empty " + std::string( p_grammar.kind ) + " name at line " +
                                  std::to_string( line_number ),
                                line_number );
      //
      entries[ std::string( name ) ] = value; // a later line overwrites
    }
    //
    if ( file.bad() )
      return status::failure( c_error_credentials_io,
                              std::string( "error reading " ) + p_grammar.kind + "s file: " + p_path );
    //
    if ( entries.empty() )
      return status::failure( c_error_credentials_empty,
                              std::string( "no valid " ) + p_grammar.kind + "s found in file: " + p_path );
    //
    spdlog::info( "loaded {} {}(s) from {}", entries.size(), p_grammar.kind, p_path );
    //
    p_entries = std::move( entries );
    return status::success();
  }

} // namespace

//--------------------------------------------------------------------
status parse_headers_file( const std::string & p_path, key_values & p_headers )
{
  return parse_file( p_path, c_headers_grammar, p_headers );
}

//--------------------------------------------------------------------
status parse_cookies_file( const std::string & p_path, key_values & p_cookies )
{
  return parse_file( p_path, c_cookies_grammar, p_cookies );
}

//--------------------------------------------------------------------
// Lenient: malformed segments are dropped, not reported
key_values parse_cookie_string( std::string_view p_cookies )
{
  key_values cookies;
  //
  while ( ! p_cookies.empty() )
  {
    auto semicolon_pos = p_cookies.find( ';' );
    auto segment       = trim( p_cookies.substr( 0, semicolon_pos ) );
    //
    p_cookies.remove_prefix( semicolon_pos == std::string_view::npos ?
                               p_cookies.size() :     // remove segment
                               semicolon_pos + 1 );   // remove segment and semicolon
    //
    if ( segment.empty() )
      continue;
    //
    std::string_view name, value;
    if ( ! split_first( segment, '=', name, value ) || name.empty() )
    {
      spdlog::debug( "ignoring malformed cookie segment of {} characters", segment.size() );
      continue;
    }
    //
    cookies[ std::string( name ) ] = value;
  }
  //
  return cookies;
}

//--------------------------------------------------------------------
// The username and password are not trimmed
status parse_basic_auth_string( std::string_view p_basic,
                                std::string &    p_username,
                                std::string &    p_password )
{
  auto colon_pos = p_basic.find( ':' );
  auto username  = p_basic.substr( 0, colon_pos );
  //
  if ( username.empty() )
    return status::failure( c_error_credentials_format,
                            "invalid basic auth format (expected 'username:password')" );
  //
  p_username = username;
  p_password = colon_pos == std::string_view::npos ? std::string_view() : p_basic.substr( colon_pos + 1 );
  //
  return status::success();
}

} // namespace curlcred
