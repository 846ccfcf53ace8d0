/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include "request.hpp"
#include "utils/curl_utils.hpp"

namespace curlcred
{

//--------------------------------------------------------------------
// key_values_ci finds the existing entry, but keeps its original name:
// the entry is replaced to send the name as last given
void Request::set_header( const std::string & p_name, const std::string & p_value )
{
  m_headers.erase( p_name );
  m_headers.emplace( p_name, p_value );
}

//--------------------------------------------------------------------
bool Request::has_header( const std::string & p_name ) const
{
  auto header = m_headers.find( p_name );
  //
  return header != m_headers.end() && ! header->second.empty();
}

//--------------------------------------------------------------------
void Request::add_cookie( const std::string & p_name, const std::string & p_value )
{
  m_cookies.emplace_back( p_name, p_value );
}

//--------------------------------------------------------------------
// CURLOPT_COOKIE is copied by libcurl, but CURLOPT_HTTPHEADER is not:
// the list stays owned by the caller.
// Nothing is applied if a header or a cookie could be split on the wire.
bool Request::apply( CURL * p_curl, curl_slist *& p_curl_headers ) const
{
  for ( const auto & [ name, value ] : m_headers )
    if ( ! is_header_name( name ) || ! is_header_value( value ) )
      return false;
  //
  for ( const auto & [ name, value ] : m_cookies )
    if ( ! is_cookie_name( name ) || ! is_cookie_value( value ) )
      return false;
  //
  bool ok = true;
  //
  if ( ! m_url.empty() )
    ok = ok && easy_setopt( p_curl, CURLOPT_URL, m_url.c_str() );
  //
  for ( const auto & [ name, value ] : m_headers )
    ok = ok && curl_slist_checked_append( p_curl_headers, curl_header_line( name, value ) );
  //
  if ( p_curl_headers != nullptr )
    ok = ok && easy_setopt( p_curl, CURLOPT_HTTPHEADER, p_curl_headers );
  //
  if ( ! m_cookies.empty() )
    ok = ok && easy_setopt( p_curl, CURLOPT_COOKIE, curl_cookie_line( m_cookies ).c_str() );
  //
  return ok;
}

} // namespace curlcred
