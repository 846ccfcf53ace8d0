/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <curl/curl.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace curlcred
{

// Wrapper around the libcurl setop function, returning true upon success
template < typename Type >
bool easy_setopt( CURL * p_curl, CURLoption p_option, Type && p_parameter )
{
  return CURLE_OK == curl_easy_setopt( p_curl, p_option, std::forward< Type >( p_parameter ) );
}

// Add std::string to a curl_slist. The first time p_list must be set to nullptr.
// p_list is updated at each call, and must be freed using curl_slist_free_all.
// p_string must not be empty.
bool curl_slist_checked_append( curl_slist *& p_list, const std::string & p_string );

// Formats a header line for CURLOPT_HTTPHEADER. libcurl removes a header
// given as "Name:", an empty header must be given as "Name;".
std::string curl_header_line( const std::string & p_name, const std::string & p_value );

// Formats cookies for CURLOPT_COOKIE: "name1=value1; name2=value2".
// A value containing spaces or commas is sent double quoted.
std::string curl_cookie_line( const std::vector< std::pair< std::string, std::string > > & p_cookies );

// libcurl sends headers and cookies as given: these check that a name or
// a value cannot end the line or the cookie it belongs to.
//   header name   a non empty token (RFC 9110)
//   header value  no control character except tabulation
//   cookie name   a non empty token
//   cookie value  no control character, no ; " or backslash
bool is_header_name ( std::string_view p_name  );
bool is_header_value( std::string_view p_value );
bool is_cookie_name ( std::string_view p_name  );
bool is_cookie_value( std::string_view p_value );

} // namespace curlcred
