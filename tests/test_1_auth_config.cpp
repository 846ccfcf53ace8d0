/*********************************************************************
 * Copyright (c) 2025, Pierre DEL PERUGIA and the curlev project contributors
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************/

#include <gtest/gtest.h>

#include "auth_config.hpp"
#include "authentication.hpp"
#include "test_utils.hpp"

using namespace curlcred;

//--------------------------------------------------------------------
TEST( auth_config, auth_type )
{
  AuthType type = AuthType::none;
  //
  EXPECT_TRUE( parse_auth_type( "bearer", type ) && type == AuthType::bearer );
  EXPECT_TRUE( parse_auth_type( "basic" , type ) && type == AuthType::basic  );
  EXPECT_TRUE( parse_auth_type( "custom", type ) && type == AuthType::custom );
  EXPECT_TRUE( parse_auth_type( "none"  , type ) && type == AuthType::none   );
  //
  EXPECT_FALSE( parse_auth_type( "digest", type ) );
  EXPECT_FALSE( parse_auth_type( "Bearer", type ) );
  EXPECT_FALSE( parse_auth_type( ""      , type ) );
  EXPECT_EQ( type, AuthType::none );
  //
  EXPECT_STREQ( to_string( AuthType::bearer ), "bearer" );
  EXPECT_STREQ( to_string( AuthType::custom ), "custom" );
  EXPECT_STREQ( to_string( static_cast< AuthType >( 42 ) ), "unknown" );
}

//--------------------------------------------------------------------
TEST( auth_config, sources_set )
{
  AuthSources sources;
  //
  EXPECT_TRUE( sources.set( "bearer=abc123, headers_file=/tmp/h.txt" ) );
  EXPECT_EQ( sources.bearer      , "abc123"     );
  EXPECT_EQ( sources.headers_file, "/tmp/h.txt" );
  //
  // Called several times, values are kept
  EXPECT_TRUE( sources.set( "cookies=a=1; b=2,user_agent=downloader/1.0" ) );
  EXPECT_EQ( sources.bearer    , "abc123"          );
  EXPECT_EQ( sources.cookies   , "a=1; b=2"        );
  EXPECT_EQ( sources.user_agent, "downloader/1.0"  );
  //
  EXPECT_TRUE( sources.set( "basic=user:pa:ss,header=Token xyz,cookies_file=/tmp/c.txt" ) );
  EXPECT_EQ( sources.basic       , "user:pa:ss" );
  EXPECT_EQ( sources.header      , "Token xyz"  );
  EXPECT_EQ( sources.cookies_file, "/tmp/c.txt" );
  //
  EXPECT_TRUE( sources.set( "type=custom" ) );
  EXPECT_EQ( sources.type, "custom" );
  //
  EXPECT_FALSE( sources.set( "digest=abc"  ) );
  EXPECT_FALSE( sources.set( "bearer"      ) );
  //
  sources.set_default();
  EXPECT_TRUE( sources.type.empty() );
  EXPECT_TRUE( sources.bearer.empty() );
  EXPECT_TRUE( sources.cookies.empty() );
  EXPECT_TRUE( sources.user_agent.empty() );
}

//--------------------------------------------------------------------
TEST( auth_config, build_none )
{
  AuthConfiguration config;
  //
  EXPECT_TRUE( build_auth_configuration( {}, config ).ok() );
  EXPECT_EQ( config.type, AuthType::none );
  EXPECT_TRUE( config.headers.empty() );
  EXPECT_TRUE( config.cookies.empty() );
  //
  Authentication authentication;
  EXPECT_TRUE( Authentication::create( AuthSources{}, authentication ).ok() );
  EXPECT_EQ( authentication.get_type(), AuthType::none );
}

//--------------------------------------------------------------------
TEST( auth_config, build_primary )
{
  AuthConfiguration config;
  AuthSources       sources;
  //
  sources.bearer = "abc";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type , AuthType::bearer );
  EXPECT_EQ( config.token, "abc"            );
  //
  sources.set_default();
  sources.basic = "user:pass:word";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type    , AuthType::basic );
  EXPECT_EQ( config.username, "user"          );
  EXPECT_EQ( config.password, "pass:word"     );
  //
  sources.set_default();
  sources.header = "Token xyz";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::custom );
  EXPECT_EQ( config.headers.size(), 1 );
  EXPECT_EQ( config.headers[ "Authorization" ], "Token xyz" );
}

//--------------------------------------------------------------------
TEST( auth_config, build_conflicts )
{
  AuthConfiguration config;
  config.token = "unchanged";
  //
  AuthSources sources;
  sources.bearer = "abc";
  sources.basic  = "user:pass";
  //
  auto result = build_auth_configuration( sources, config );
  EXPECT_EQ( result.code, c_error_authentication_validation );
  EXPECT_NE( result.message.find( "multiple" ), std::string::npos ) << result.message;
  EXPECT_EQ( config.token, "unchanged" );
  //
  sources.basic .clear();
  sources.header = "X";
  EXPECT_EQ( build_auth_configuration( sources, config ).code, c_error_authentication_validation );
  //
  // Basic auth string errors are propagated
  sources.set_default();
  sources.basic = ":nouser";
  EXPECT_EQ( build_auth_configuration( sources, config ).code, c_error_credentials_format );
}

//--------------------------------------------------------------------
TEST( auth_config, build_overlays )
{
  AuthConfiguration config;
  AuthSources       sources;
  //
  sources.header       = "from-flag";
  sources.headers_file = write_temp_file( "headers.txt", "X-API-Key: k1\nAuthorization: from-file\n" );
  sources.user_agent   = "downloader/1.0";
  sources.cookies_file = write_temp_file( "cookies.txt", "session=file\nother=file\n" );
  sources.cookies      = "session=inline; extra=inline";
  //
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::custom );
  //
  EXPECT_EQ( config.headers.size(), 3 );
  EXPECT_EQ( config.headers[ "Authorization" ], "from-file"      ); // merged after the flag
  EXPECT_EQ( config.headers[ "X-API-Key"     ], "k1"             );
  EXPECT_EQ( config.headers[ "User-Agent"    ], "downloader/1.0" );
  //
  EXPECT_EQ( config.cookies.size(), 3 );
  EXPECT_EQ( config.cookies[ "session" ], "inline" ); // inline cookies override the file
  EXPECT_EQ( config.cookies[ "other"   ], "file"   );
  EXPECT_EQ( config.cookies[ "extra"   ], "inline" );
}

//--------------------------------------------------------------------
TEST( auth_config, build_promotes_to_custom )
{
  AuthConfiguration config;
  AuthSources       sources;
  //
  sources.user_agent = "downloader/1.0";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::custom );
  //
  sources.set_default();
  sources.cookies = "a=1";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::custom );
  //
  // Only malformed cookies: nothing to apply
  sources.cookies = "malformed";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::none );
  //
  // A bearer with overlays stays a bearer
  sources.set_default();
  sources.bearer     = "abc";
  sources.user_agent = "downloader/1.0";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::bearer );
}

//--------------------------------------------------------------------
TEST( auth_config, build_file_errors )
{
  AuthConfiguration config;
  AuthSources       sources;
  //
  sources.bearer       = "abc";
  sources.headers_file = write_temp_file( "headers.txt", "X-A: 1\nbroken\n" );
  //
  auto result = build_auth_configuration( sources, config );
  EXPECT_EQ( result.code, c_error_credentials_format );
  EXPECT_EQ( result.line, 2 );
  EXPECT_EQ( config.type, AuthType::none ); // untouched
  //
  sources.headers_file.clear();
  sources.cookies_file = missing_file_path();
  EXPECT_EQ( build_auth_configuration( sources, config ).code, c_error_credentials_io );
  //
  sources.cookies_file = write_temp_file( "cookies.txt", "# none\n" );
  EXPECT_EQ( build_auth_configuration( sources, config ).code, c_error_credentials_empty );
  //
  Authentication authentication;
  EXPECT_EQ( Authentication::create( sources, authentication ).code, c_error_credentials_empty );
  EXPECT_EQ( authentication.get_type(), AuthType::none );
}

//--------------------------------------------------------------------
// From the raw sources to a decorated request
TEST( auth_config, end_to_end )
{
  AuthSources sources;
  ASSERT_TRUE( sources.set( "bearer=Bearer abc,user_agent=downloader/1.0,cookies=sid=42" ) );
  //
  Authentication authentication;
  ASSERT_TRUE( Authentication::create( sources, authentication ).ok() );
  EXPECT_EQ( authentication.get_type(), AuthType::bearer );
  //
  Request request( "https://example.com/archive.zip" );
  ASSERT_TRUE( authentication.apply( request ).ok() );
  //
  EXPECT_EQ( header_of( request, "Authorization" ), "Bearer abc"     );
  EXPECT_EQ( header_of( request, "User-Agent"    ), "downloader/1.0" );
  ASSERT_EQ( request.get_cookies().size(), 1 );
  EXPECT_EQ( request.get_cookies()[ 0 ].first , "sid" );
  EXPECT_EQ( request.get_cookies()[ 0 ].second, "42"  );
}

//--------------------------------------------------------------------
TEST( auth_config, build_explicit_type )
{
  AuthConfiguration config;
  AuthSources       sources;
  //
  sources.type = "digest";
  auto result = build_auth_configuration( sources, config );
  EXPECT_EQ( result.code, c_error_authentication_validation );
  EXPECT_NE( result.message.find( "digest" ), std::string::npos ) << result.message;
  //
  // Explicit none is not promoted to custom
  sources.set_default();
  sources.type       = "none";
  sources.user_agent = "downloader/1.0";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::none );
  EXPECT_EQ( config.headers[ "User-Agent" ], "downloader/1.0" );
  //
  // The explicit type is kept, the provider refuses the missing username
  sources.set_default();
  sources.type   = "basic";
  sources.bearer = "abc";
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.type, AuthType::basic );
  //
  Authentication authentication;
  EXPECT_EQ( Authentication::create( sources, authentication ).code, c_error_authentication_validation );
  EXPECT_EQ( authentication.get_type(), AuthType::none );
  //
  sources.type = "bearer";
  EXPECT_TRUE( Authentication::create( sources, authentication ).ok() );
  EXPECT_EQ( authentication.get_type(), AuthType::bearer );
}

//--------------------------------------------------------------------
// Header names from different sources are compared ignoring case
TEST( auth_config, build_header_case )
{
  AuthConfiguration config;
  AuthSources       sources;
  //
  sources.header       = "from-flag";
  sources.user_agent   = "downloader/1.0";
  sources.headers_file = write_temp_file( "headers.txt", "authorization: from-file\nuser-agent: file/1.0\n" );
  //
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  //
  EXPECT_EQ( config.headers.size(), 2 );
  EXPECT_EQ( config.headers.count( "Authorization" ), 0 );
  EXPECT_EQ( config.headers[ "authorization" ], "from-file"      );
  EXPECT_EQ( config.headers.count( "user-agent" ), 0 );
  EXPECT_EQ( config.headers[ "User-Agent"    ], "downloader/1.0" );
  //
  Authentication authentication;
  ASSERT_TRUE( Authentication::create( config, authentication ).ok() );
  //
  Request request;
  ASSERT_TRUE( authentication.apply( request ).ok() );
  EXPECT_EQ( header_of( request, "Authorization" ), "from-file"      );
  EXPECT_EQ( header_of( request, "User-Agent"    ), "downloader/1.0" );
}

//--------------------------------------------------------------------
// A cookies file line is one cookie, it cannot smuggle a second one
TEST( auth_config, build_cookie_injection )
{
  AuthConfiguration config;
  AuthSources       sources;
  //
  sources.cookies_file = write_temp_file( "cookies.txt", "sid=a; admin=1\n" );
  //
  ASSERT_TRUE( build_auth_configuration( sources, config ).ok() );
  EXPECT_EQ( config.cookies.size(), 1 );
  EXPECT_EQ( config.cookies[ "sid" ], "a; admin=1" );
  //
  Authentication authentication;
  EXPECT_EQ( Authentication::create( config, authentication ).code, c_error_authentication_validation );
  EXPECT_EQ( authentication.get_type(), AuthType::none );
}
