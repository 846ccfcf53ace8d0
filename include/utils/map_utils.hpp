/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <string>
#include <unordered_map>

namespace curlcred
{

// Case insensitive operations for the std::unordered_map of key_values_ci
struct hash_ci
{
  std::size_t operator()( const std::string & p_key ) const;
  bool        operator()( const std::string & p_a, const std::string & p_b ) const;
};

// Used to convey credential headers and cookies (unordered_map are almost twice as fast as map).
// Names are case sensitive: a later duplicate overwrites the earlier one.
using key_values    = std::unordered_map< std::string, std::string >;
//
// Used for the headers of an outgoing request, where "authorization" and
// "Authorization" designate the same header
using key_values_ci = std::unordered_map< std::string, std::string, hash_ci, hash_ci >;

// Copies all entries of p_source into p_target, overwriting existing names
void merge_key_values( key_values & p_target, const key_values & p_source );

// Same for headers: an entry of p_target is also replaced by a p_source
// entry whose name differs only by case. Entries of p_source are all kept.
void merge_headers( key_values & p_target, const key_values & p_source );

} // namespace curlcred
