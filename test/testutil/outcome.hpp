#ifndef FEDSYNC_GTEST_OUTCOME_UTIL_HPP
#define FEDSYNC_GTEST_OUTCOME_UTIL_HPP

#include <gtest/gtest.h>

#include "outcome/outcome.hpp"

#define PP_CAT( a, b ) PP_CAT_I( a, b )
#define PP_CAT_I( a, b ) PP_CAT_II( ~, a##b )
#define PP_CAT_II( p, res ) res

#define UNIQUE_NAME( base ) PP_CAT( base, __LINE__ )

#define EXPECT_OUTCOME_TRUE_void( var, expr )                                                                        \
    auto &&var = expr;                                                                                               \
    EXPECT_TRUE( var ) << "Line " << __LINE__ << ": " << var.error().message();

#define EXPECT_OUTCOME_TRUE_name( var, val, expr )                                                                   \
    auto &&var = expr;                                                                                               \
    EXPECT_TRUE( var ) << "Line " << __LINE__ << ": " << var.error().message();                                      \
    auto &&val = var.value();

#define EXPECT_OUTCOME_FALSE_void( var, expr )                                                                       \
    auto &&var = expr;                                                                                               \
    EXPECT_FALSE( var ) << "Line " << __LINE__;

#define EXPECT_OUTCOME_FALSE_name( var, val, expr )                                                                  \
    auto &&var = expr;                                                                                               \
    EXPECT_FALSE( var ) << "Line " << __LINE__;                                                                      \
    auto &&val = var.error();

/// Expect @a expr to succeed and bind its value to @a val
#define EXPECT_OUTCOME_TRUE_2( val, expr ) EXPECT_OUTCOME_TRUE_name( UNIQUE_NAME( _r ), val, expr )

/// Expect @a expr to succeed, value discarded
#define EXPECT_OUTCOME_TRUE_1( expr ) EXPECT_OUTCOME_TRUE_void( UNIQUE_NAME( _v ), expr )

/// Expect @a expr to fail and bind its error to @a val
#define EXPECT_OUTCOME_FALSE_2( val, expr ) EXPECT_OUTCOME_FALSE_name( UNIQUE_NAME( _r ), val, expr )

/// Expect @a expr to fail, error discarded
#define EXPECT_OUTCOME_FALSE_1( expr ) EXPECT_OUTCOME_FALSE_void( UNIQUE_NAME( _v ), expr )

#endif // FEDSYNC_GTEST_OUTCOME_UTIL_HPP
