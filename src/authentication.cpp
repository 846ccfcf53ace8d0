/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <utility>

#include "authentication.hpp"

namespace curlcred
{

namespace
{
  //------------------------------------------------------------------
  // Used when no authentication is configured
  class NoAuthentication final : public RequestDecorator
  {
  public:
    status   apply( Request & ) const override { return status::success(); }
    AuthType get_type() const noexcept override { return AuthType::none; }
  };

  // Shared by all default constructed Authentication
  std::shared_ptr< const RequestDecorator > no_authentication()
  {
    static const auto instance = std::make_shared< const NoAuthentication >();
    return instance;
  }

} // namespace

//--------------------------------------------------------------------
Authentication::Authentication() :
  m_decorator( no_authentication() )
{
}

//--------------------------------------------------------------------
Authentication::Authentication( std::shared_ptr< const RequestDecorator > p_decorator ) :
  m_decorator( std::move( p_decorator ) )
{
}

//--------------------------------------------------------------------
status Authentication::create( const AuthConfiguration & p_config, Authentication & p_authentication )
{
  std::shared_ptr< const AuthProvider > provider;
  //
  auto result = AuthProvider::create( p_config, provider );
  if ( ! result.ok() )
    return result;
  //
  p_authentication = Authentication( std::move( provider ) );
  return status::success();
}

//--------------------------------------------------------------------
status Authentication::create( const AuthSources & p_sources, Authentication & p_authentication )
{
  AuthConfiguration config;
  //
  auto result = build_auth_configuration( p_sources, config );
  if ( ! result.ok() )
    return result;
  //
  return create( config, p_authentication );
}

} // namespace curlcred
