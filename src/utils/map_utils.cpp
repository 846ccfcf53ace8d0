/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <algorithm>
#include <cctype>
#include <iterator>

#include "utils/map_utils.hpp"
#include "utils/string_utils.hpp"

namespace curlcred
{

//--------------------------------------------------------------------
// Calculates a case insensitive hash optimized for HTTP header keys
// (2 to 30 characters, a-z and - characters, limited number of headers).
// For the 50 most common headers there is no collision.
std::size_t hash_ci::operator()( const std::string & p_key ) const
{
  constexpr std::size_t multiplier = 31;
  std::size_t           hash       = 0;
  //
  for ( char c : p_key )
    hash = multiplier * hash + std::tolower( static_cast< unsigned char >( c ) ); // cppcheck-suppress useStlAlgorithm
  //
  return hash;
}

//--------------------------------------------------------------------
// HTTP header keys use ASCII-US, so there is no need for std::lexicographical_compare
bool hash_ci::operator()( const std::string & p_a, const std::string & p_b ) const
{
  return equal_ascii_ci( p_a, p_b );
}

//--------------------------------------------------------------------
// unordered_map::insert would keep the existing value, the later source must win
void merge_key_values( key_values & p_target, const key_values & p_source )
{
  for ( const auto & [ name, value ] : p_source )
    p_target[ name ] = value;
}

//--------------------------------------------------------------------
// Entries replaced whatever their case are removed first, then p_source is copied
void merge_headers( key_values & p_target, const key_values & p_source )
{
  for ( auto entry = p_target.begin(); entry != p_target.end(); )
  {
    bool replaced = std::any_of( p_source.begin(), p_source.end(),
                                 [ & ]( const auto & p_other ) { return equal_ascii_ci( p_other.first, entry->first ); } );
    //
    entry = replaced ? p_target.erase( entry ) : std::next( entry );
  }
  //
  merge_key_values( p_target, p_source );
}

} // namespace curlcred
