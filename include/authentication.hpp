/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#pragma once

#include <memory>

#include "auth_config.hpp"
#include "auth_provider.hpp"
#include "request.hpp"
#include "status.hpp"

namespace curlcred
{

//--------------------------------------------------------------------
// This class is given to every download worker to decorate its requests.
// A default constructed Authentication does nothing: apply() never
// modifies the request and never fails, so workers do not have to know
// whether authentication was configured.
// It is a cheap to copy, read only handle on an immutable provider.
class Authentication
{
public:
  Authentication();
  //
  // Builds the provider from a configuration. On error p_authentication is unchanged.
  static status create( const AuthConfiguration & p_config, Authentication & p_authentication );
  //
  // Builds the configuration from raw sources, then the provider
  static status create( const AuthSources & p_sources, Authentication & p_authentication );
  //
  // Apply credential to the request
  status apply( Request & p_request ) const { return m_decorator->apply( p_request ); }
  //
  // none if authentication is not configured
  AuthType get_type() const noexcept { return m_decorator->get_type(); }
  //
private:
  explicit Authentication( std::shared_ptr< const RequestDecorator > p_decorator );
  //
  std::shared_ptr< const RequestDecorator > m_decorator;
};

} // namespace curlcred
