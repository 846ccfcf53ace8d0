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

//--------------------------------------------------------------------
// Credential files are parsed strictly: the first invalid line aborts
// the whole parse. Blank lines and lines starting with # are ignored.
// On error p_headers / p_cookies are left untouched.

// Parses a file of "Name: value" lines, split on the first colon.
// Fails with c_error_credentials_io, c_error_credentials_format (line set)
// or c_error_credentials_empty if the file has no header at all.
status parse_headers_file( const std::string & p_path, key_values & p_headers );

// Parses a file of "name=value" lines, split on the first equal sign.
// Same errors as parse_headers_file.
status parse_cookies_file( const std::string & p_path, key_values & p_cookies );

//--------------------------------------------------------------------
// Inline credential strings are parsed leniently.

// Parses "name1=value1; name2=value2". Segments without = or with an
// empty name are dropped. An empty string gives an empty map.
key_values parse_cookie_string( std::string_view p_cookies );

// Parses "username" or "username:password". Only the first colon is
// significant, the password may contain others. Fails with
// c_error_credentials_format if the username is empty.
status parse_basic_auth_string( std::string_view p_basic,
                                std::string &    p_username,
                                std::string &    p_password );

} // namespace curlcred
