/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <strings.h>

#include "utils/string_utils.hpp"

namespace curlcred
{

namespace
{
  constexpr std::array< char, 64 > c_base64_alphabet = {
      'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
      'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
      'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
      'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'
  };

  constexpr char c_base64_padding = '=';

  // UTF-8 bytes are negative as char, std::isspace requires unsigned char values
  bool is_space( char p_character )
  {
    return std::isspace( static_cast< unsigned char >( p_character ) ) != 0;
  }

} // namespace

//--------------------------------------------------------------------
// Remove leading and trailing white spaces (space, tabulations...) from a string
std::string_view trim( std::string_view p_string )
{
  const auto * begin = std::find_if_not( p_string.begin() , p_string.end() , is_space );
  const auto * end   = std::find_if_not( p_string.rbegin(), p_string.rend(), is_space ).base();
  //
  return ( begin < end ) ? std::string_view( begin, end - begin ) : std::string_view();
}

//--------------------------------------------------------------------
// Checks is two ASCII strings are equal, ignoring case differences,
// strcasecmp is ~5 times faster than std::lexicographical_compare.
bool equal_ascii_ci( const std::string & p_a, const std::string & p_b )
{
  return p_a.length() == p_b.length() &&
         strcasecmp( p_a.c_str(), p_b.c_str() ) == 0;
}

//--------------------------------------------------------------------
// string_view are not null terminated, strncasecmp only reads the prefix length
bool starts_with_ascii_ci( std::string_view p_string, std::string_view p_prefix )
{
  return p_string.length() >= p_prefix.length() &&
         strncasecmp( p_string.data(), p_prefix.data(), p_prefix.length() ) == 0;
}

//--------------------------------------------------------------------
// Splits p_string on the first occurrence of p_delimiter. Both parts are trimmed.
// Subsequent delimiters are part of the value.
bool split_first( std::string_view   p_string,
                  char               p_delimiter,
                  std::string_view & p_name,
                  std::string_view & p_value )
{
  auto delimiter_pos = p_string.find( p_delimiter );
  if ( delimiter_pos == std::string_view::npos )
    return false;
  //
  p_name  = trim( p_string.substr( 0, delimiter_pos  ) );
  p_value = trim( p_string.substr( delimiter_pos + 1 ) );
  //
  return true;
}

//--------------------------------------------------------------------
// Each group of 3 bytes gives 4 characters, the last group is padded.
std::string base64_encode( std::string_view p_data )
{
  constexpr auto mask = 0x3FU;
  //
  std::string result;
  result.reserve( ( p_data.size() + 2 ) / 3 * 4 );
  //
  size_t i = 0;
  //
  for ( ; i + 2 < p_data.size(); i += 3 )
  {
    uint32_t group = ( static_cast< unsigned char >( p_data[ i     ] ) << 16U ) |
                     ( static_cast< unsigned char >( p_data[ i + 1 ] ) <<  8U ) |
                       static_cast< unsigned char >( p_data[ i + 2 ] );
    //
    result += c_base64_alphabet[ ( group >> 18U ) & mask ];
    result += c_base64_alphabet[ ( group >> 12U ) & mask ];
    result += c_base64_alphabet[ ( group >>  6U ) & mask ];
    result += c_base64_alphabet[   group          & mask ];
  }
  //
  if ( i < p_data.size() ) // 1 or 2 remaining bytes
  {
    bool     two   = i + 1 < p_data.size();
    uint32_t group = static_cast< unsigned char >( p_data[ i ] ) << 16U;
    if ( two )
      group |= static_cast< unsigned char >( p_data[ i + 1 ] ) << 8U;
    //
    result += c_base64_alphabet[ ( group >> 18U ) & mask ];
    result += c_base64_alphabet[ ( group >> 12U ) & mask ];
    result += two ? c_base64_alphabet[ ( group >> 6U ) & mask ] : c_base64_padding;
    result += c_base64_padding;
  }
  //
  return result;
}

} // namespace curlcred
