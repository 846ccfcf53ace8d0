/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <string>

#include "request.hpp"

// Writes p_content in a new file of the temporary directory and returns its path.
// The file name is made unique by the current test name.
std::string write_temp_file( const std::string & p_name, const std::string & p_content );

// Returns a path to a file that does not exist
std::string missing_file_path();

// Returns the value of the header p_name of the request, or "?" if not set
std::string header_of( const curlcred::Request & p_request, const std::string & p_name );
