#include "federation/backoff.hpp"

#include <thread>

#include <gtest/gtest.h>
#include <boost/system/error_code.hpp>

#include "testutil/outcome.hpp"

namespace fedsync::federation
{
    using std::chrono::milliseconds;

    TEST( BackoffTest, DelayDoublesUpToTheCap )
    {
        Backoff backoff( milliseconds( 100 ), milliseconds( 1000 ), 5 );

        EXPECT_EQ( backoff.Delay( 0 ), milliseconds( 100 ) );
        EXPECT_EQ( backoff.Delay( 1 ), milliseconds( 200 ) );
        EXPECT_EQ( backoff.Delay( 3 ), milliseconds( 800 ) );
        EXPECT_EQ( backoff.Delay( 4 ), milliseconds( 1000 ) );
        EXPECT_EQ( backoff.Delay( 200 ), milliseconds( 1000 ) );
        EXPECT_EQ( backoff.Delay( -3 ), milliseconds( 100 ) );
    }

    TEST( BackoffTest, JitterStaysWithinItsFraction )
    {
        Backoff backoff( milliseconds( 1000 ), milliseconds( 1000 ), 1, 0.2 );
        for ( int i = 0; i < 50; ++i )
        {
            auto delay = backoff.Delay( 0 );
            EXPECT_GE( delay, milliseconds( 800 ) );
            EXPECT_LE( delay, milliseconds( 1200 ) );
        }
    }

    TEST( BackoffTest, RetryStopsAtFirstSuccess )
    {
        Backoff           backoff( milliseconds( 1 ), milliseconds( 2 ), 5 );
        CancellationToken token;

        int  calls  = 0;
        auto result = backoff.Retry(
            [&calls]( int attempt ) -> outcome::result<void>
            {
                ++calls;
                if ( attempt < 2 )
                {
                    return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::timed_out ) );
                }
                return outcome::success();
            },
            token );

        EXPECT_TRUE( result );
        EXPECT_EQ( calls, 3 );
    }

    TEST( BackoffTest, RetryReturnsTheLastFailure )
    {
        Backoff           backoff( milliseconds( 1 ), milliseconds( 2 ), 3 );
        CancellationToken token;

        int  calls  = 0;
        auto result = backoff.Retry(
            [&calls]( int ) -> outcome::result<void>
            {
                ++calls;
                return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::host_unreachable ) );
            },
            token );

        ASSERT_FALSE( result );
        EXPECT_EQ( result.error().value(), static_cast<int>( boost::system::errc::host_unreachable ) );
        EXPECT_EQ( calls, 3 );
    }

    TEST( BackoffTest, CancelInterruptsTheWait )
    {
        Backoff           backoff( milliseconds( 10000 ), milliseconds( 10000 ), 3 );
        CancellationToken token;

        std::thread canceller(
            [token]() mutable
            {
                std::this_thread::sleep_for( milliseconds( 50 ) );
                token.Cancel();
            } );

        auto start  = std::chrono::steady_clock::now();
        auto result = backoff.Retry(
            []( int ) -> outcome::result<void>
            { return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::timed_out ) ); },
            token );
        canceller.join();

        ASSERT_FALSE( result );
        EXPECT_EQ( result.error().value(), static_cast<int>( boost::system::errc::operation_canceled ) );
        EXPECT_LT( std::chrono::steady_clock::now() - start, milliseconds( 5000 ) );
    }

    TEST( CancellationTokenTest, CopiesShareTheFlag )
    {
        CancellationToken token;
        auto              copy = token;

        EXPECT_TRUE( copy.WaitFor( milliseconds( 1 ) ) );
        token.Cancel();
        token.Cancel();
        EXPECT_TRUE( copy.IsCancelled() );
        EXPECT_FALSE( copy.WaitFor( milliseconds( 10000 ) ) );
    }
} // namespace fedsync::federation
