/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <algorithm>
#include <cctype>
#include <cstring>

#include "utils/curl_utils.hpp"

namespace curlcred
{

namespace
{
  // Control characters: 0x00 to 0x1F and DEL
  bool is_control( char p_character )
  {
    auto c = static_cast< unsigned char >( p_character );
    return c < 0x20U || c == 0x7FU;
  }

  // tchar of RFC 9110: alphanumeric or one of !#$%&'*+-.^_`|~
  bool is_token_character( char p_character )
  {
    auto c = static_cast< unsigned char >( p_character );
    return ( c < 0x80U && std::isalnum( c ) != 0 ) ||
           ( c != 0 && std::strchr( "!#$%&'*+-.^_`|~", c ) != nullptr );
  }

  bool is_token( std::string_view p_string )
  {
    return ! p_string.empty() &&
           std::all_of( p_string.begin(), p_string.end(), is_token_character );
  }

  // Such values are sent between double quotes
  bool needs_quotes( const std::string & p_value )
  {
    return p_value.find_first_of( " ," ) != std::string::npos;
  }

} // namespace

//--------------------------------------------------------------------
// curl_slist_append returns nullptr on error: the previous value of
// p_list is kept so the caller can still free it.
bool curl_slist_checked_append( curl_slist *& p_list, const std::string & p_string )
{
  if ( p_string.empty() )
    return false;
  //
  curl_slist * appended = curl_slist_append( p_list, p_string.c_str() ); // string is copied
  if ( appended == nullptr )
    return false;
  //
  p_list = appended;
  return true;
}

//--------------------------------------------------------------------
std::string curl_header_line( const std::string & p_name, const std::string & p_value )
{
  return p_value.empty() ? p_name + ";" : p_name + ": " + p_value;
}

//--------------------------------------------------------------------
std::string curl_cookie_line( const std::vector< std::pair< std::string, std::string > > & p_cookies )
{
  std::string line;
  //
  for ( const auto & [ name, value ] : p_cookies )
  {
    if ( ! line.empty() )
      line += "; ";
    line += needs_quotes( value ) ? name + "=\"" + value + "\"" :
                                    name + "=" + value;
  }
  //
  return line;
}

//--------------------------------------------------------------------
bool is_header_name( std::string_view p_name )
{
  return is_token( p_name );
}

//--------------------------------------------------------------------
// CR or LF would start a new header line, NUL would truncate it
bool is_header_value( std::string_view p_value )
{
  return std::none_of( p_value.begin(), p_value.end(),
                       []( char c ) { return is_control( c ) && c != '\t'; } );
}

//--------------------------------------------------------------------
bool is_cookie_name( std::string_view p_name )
{
  return is_token( p_name );
}

//--------------------------------------------------------------------
// ; would start a new cookie, " and backslash would break the quoting
bool is_cookie_value( std::string_view p_value )
{
  return std::none_of( p_value.begin(), p_value.end(),
                       []( char c ) { return is_control( c ) || c == ';' || c == '"' || c == '\\'; } );
}

} // namespace curlcred
