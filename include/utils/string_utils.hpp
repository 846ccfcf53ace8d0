/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace curlcred
{

// Removes leading and trailing white spaces (spaces, tabulations...) from a string
std::string_view trim( std::string_view p_string );

// Checks is two ASCII strings are equal, ignoring case differences.
bool equal_ascii_ci( const std::string & p_a, const std::string & p_b );

// Checks if p_string starts with the ASCII p_prefix, ignoring case differences.
bool starts_with_ascii_ci( std::string_view p_string, std::string_view p_prefix );

// Splits p_string on the first occurrence of p_delimiter. Both parts are trimmed.
// Returns false if p_delimiter is not found.
bool split_first( std::string_view   p_string,
                  char               p_delimiter,
                  std::string_view & p_name,
                  std::string_view & p_value );

// Encodes p_data using the standard base64 alphabet, with padding (RFC 4648)
std::string base64_encode( std::string_view p_data );

// Parses a key-value comma-separated string (CSKV) and calls the handler for each pair.
// The handler receives two string_view and must return false if the key-value pair is invalid.
template < typename Callable >
bool parse_cskv( std::string_view p_cskv, Callable && p_handler )
{
  while ( ! p_cskv.empty() )
  {
    auto comma_pos = p_cskv.find( ',' );
    auto key_value = p_cskv.substr( 0, comma_pos );
    //
    p_cskv.remove_prefix( comma_pos == std::string_view::npos ?
                            p_cskv.size() :   // remove key_value
                            comma_pos + 1 );  // remove key_value and comma
    //
    std::string_view key, value;
    if ( ! split_first( key_value, '=', key, value ) )
      return false; // invalid format: no = sign
    //
    if ( ! std::forward< Callable >( p_handler )( key, value ) )
      return false; // invalid option reported
  }
  //
  return true;
}

} // namespace curlcred
