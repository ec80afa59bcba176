#include "federation/backoff.hpp"

#include <algorithm>
#include <random>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <boost/system/error_code.hpp>

namespace fedsync::federation
{
    CancellationToken::CancellationToken() : state_( std::make_shared<State>() ) {}

    void CancellationToken::Cancel()
    {
        {
            std::lock_guard lock( state_->mutex );
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool CancellationToken::IsCancelled() const
    {
        return state_->cancelled.load();
    }

    bool CancellationToken::WaitFor( std::chrono::milliseconds duration ) const
    {
        std::unique_lock lock( state_->mutex );
        return !state_->cv.wait_for( lock, duration, [this] { return state_->cancelled.load(); } );
    }

    Backoff::Backoff( milliseconds base, milliseconds cap, int maxAttempts, double jitter ) :
        base_( base ), cap_( cap ), maxAttempts_( maxAttempts ), jitter_( std::clamp( jitter, 0.0, 1.0 ) )
    {
    }

    Backoff::milliseconds Backoff::Delay( int attempt ) const
    {
        attempt = std::max( attempt, 0 );

        long long delay = base_.count();
        // Saturate before shifting past the cap
        for ( int i = 0; i < attempt && delay < cap_.count(); ++i )
        {
            delay *= 2;
        }
        delay = std::min( delay, static_cast<long long>( cap_.count() ) );

        if ( jitter_ > 0.0 && delay > 0 )
        {
            thread_local boost::random::mt19937             generator( std::random_device{}() );
            boost::random::uniform_real_distribution<double> spread( -jitter_, jitter_ );
            delay = static_cast<long long>( static_cast<double>( delay ) * ( 1.0 + spread( generator ) ) );
        }
        return milliseconds( delay );
    }

    outcome::result<void> Backoff::Retry( const std::function<outcome::result<void>( int attempt )> &operation,
                                          const CancellationToken                                   &token ) const
    {
        outcome::result<void> last = outcome::success();
        for ( int attempt = 0; attempt < maxAttempts_; ++attempt )
        {
            if ( token.IsCancelled() )
            {
                return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::operation_canceled ) );
            }
            last = operation( attempt );
            if ( last.has_value() )
            {
                return last;
            }
            if ( attempt + 1 < maxAttempts_ && !token.WaitFor( Delay( attempt ) ) )
            {
                return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::operation_canceled ) );
            }
        }
        return last;
    }
} // namespace fedsync::federation
