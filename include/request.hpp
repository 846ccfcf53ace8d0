/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <curl/curl.h>
#include <string>
#include <utility>
#include <vector>

#include "utils/map_utils.hpp"

namespace curlcred
{

//--------------------------------------------------------------------
// An outgoing request, owned by a single download worker.
// It collects the headers and cookies to send, then applies them
// to the curl easy handle performing the transfer.
class Request
{
public:
  using cookie_list = std::vector< std::pair< std::string, std::string > >;
  //
  Request() = default;
  explicit Request( std::string p_url ) : m_url( std::move( p_url ) ) {}
  //
  // Sets a header, replacing any existing one whatever the case of its name
  void set_header( const std::string & p_name, const std::string & p_value );
  //
  // Returns true if a non empty value is set for this header (case insensitive)
  bool has_header( const std::string & p_name ) const;
  //
  // Adds a cookie. Cookies are independent: adding one never removes another.
  void add_cookie( const std::string & p_name, const std::string & p_value );
  //
  const std::string   & get_url    () const noexcept { return m_url;     }
  const key_values_ci & get_headers() const noexcept { return m_headers; }
  const cookie_list   & get_cookies() const noexcept { return m_cookies; }
  //
  // Apply URL, headers and cookies to curl easy handle.
  // p_curl_headers must be nullptr or a list previously built by the caller;
  // it is updated and must be kept until the transfer completes, then freed
  // using curl_slist_free_all.
  // It returns false, without setting anything, if a header or a cookie
  // contains characters not allowed by HTTP (see is_header_value...),
  // and false if any option fails to set.
  bool apply( CURL * p_curl, curl_slist *& p_curl_headers ) const;
  //
private:
  std::string   m_url;
  key_values_ci m_headers;
  cookie_list   m_cookies;
};

} // namespace curlcred
