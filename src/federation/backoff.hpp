/**
 * @file       backoff.hpp
 * @brief      Retry delays and cooperative cancellation shared by sessions and transports
 */
#ifndef FEDSYNC_BACKOFF_HPP
#define FEDSYNC_BACKOFF_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

#include "outcome/outcome.hpp"

namespace fedsync::federation
{
    /**
     * @brief Cancellation flag that can be waited on. Copies share the flag.
     */
    class CancellationToken
    {
    public:
        CancellationToken();

        /** Idempotent */
        void Cancel();

        bool IsCancelled() const;

        /**
         * @brief Sleep for @param duration unless cancelled first
         * @return true if the full duration elapsed, false if cancelled
         */
        bool WaitFor( std::chrono::milliseconds duration ) const;

    private:
        struct State
        {
            std::atomic<bool>       cancelled{ false };
            std::mutex              mutex;
            std::condition_variable cv;
        };
        std::shared_ptr<State> state_;
    };

    /**
     * @brief Exponential backoff: delay(attempt) = min(base * 2^attempt, cap) +/- jitter
     */
    class Backoff
    {
    public:
        using milliseconds = std::chrono::milliseconds;

        /**
         * @param base delay of attempt 0
         * @param cap upper bound of every delay
         * @param maxAttempts attempts allowed by Retry()
         * @param jitter fraction in [0, 1] of random spread applied to each delay
         */
        Backoff( milliseconds base, milliseconds cap, int maxAttempts, double jitter = 0.0 );

        milliseconds Delay( int attempt ) const;

        int MaxAttempts() const
        {
            return maxAttempts_;
        }

        /**
         * @brief Run @param operation until it succeeds, attempts are exhausted or @param token is cancelled
         * @param operation called with the zero based attempt number
         * @return last failure, or errc::operation_canceled if cancelled
         */
        outcome::result<void> Retry( const std::function<outcome::result<void>( int attempt )> &operation,
                                     const CancellationToken                                   &token ) const;

    private:
        milliseconds base_;
        milliseconds cap_;
        int          maxAttempts_;
        double       jitter_;
    };
} // namespace fedsync::federation

#endif // FEDSYNC_BACKOFF_HPP
