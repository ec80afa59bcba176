#ifndef FEDSYNC_FEDERATION_OPTIONS_HPP
#define FEDSYNC_FEDERATION_OPTIONS_HPP

#include <chrono>
#include <memory>

#include "base/logger.hpp"
#include "federation/federation_types.hpp"
#include "outcome/outcome.hpp"

namespace fedsync::federation
{
    /** @brief Options holds configurable values for the federation engine
    */
    struct FederationOptions
    {
        using milliseconds = std::chrono::milliseconds;

        /** Strategy every session uses to reach the followed site */
        TransportKind transport = TransportKind::RealTime;

        /** Import pointers into the federation index instead of full content */
        bool useFederationIndex = false;

        /** Items reconciled concurrently, batches run one after the other */
        size_t reconcileBatchSize = 20;

        /** Items pulled from a followed site right after a session opens */
        size_t initialSyncLimit = 1000;

        /** Batch size of the full mirror scan and of unfollow purges */
        size_t scanBatchSize = 1000;

        /** Open timeout of the first attempt, shrinking by openTimeoutStep per attempt down to minOpenTimeout */
        milliseconds openTimeout{ 15000 };
        milliseconds openTimeoutStep{ 2000 };
        milliseconds minOpenTimeout{ 5000 };

        /** Connection attempts before falling back to background retries */
        int maxConnectAttempts = 5;

        /** Delay between connection attempts is min(connectBackoffBase * 2^(attempt-1), connectBackoffCap) */
        milliseconds connectBackoffBase{ 2000 };
        milliseconds connectBackoffCap{ 30000 };

        /** Period of the retry loop of a Failed session */
        milliseconds backgroundRetryInterval{ 30000 };

        /** Liveness check period and idle threshold after which a session is Degraded */
        milliseconds healthCheckInterval{ 30000 };
        milliseconds maxIdle{ 5 * 60 * 1000 };

        /** Reconnect backoff min(reconnectBackoffBase * 2^attempt, reconnectBackoffCap) */
        milliseconds reconnectBackoffBase{ 1000 };
        milliseconds reconnectBackoffCap{ 60000 };
        int          maxReconnectAttempts = 10;

        /** Message bus historical sync window and polling period */
        milliseconds historicalSyncWindow{ 60000 };
        milliseconds historicalSyncPollInterval{ 3000 };

        /** Message bus subscriber discovery before publishing */
        milliseconds subscriberDiscoveryTimeout{ 2000 };
        milliseconds subscriberPollInterval{ 100 };
        milliseconds subscriptionWaitTimeout{ 5000 };

        /** Opens made outside a running session, such as snapshots, retry with jittered backoff */
        milliseconds snapshotOpenTimeout{ 5000 };
        int          snapshotOpenAttempts = 3;
        milliseconds snapshotRetryBase{ 250 };
        milliseconds snapshotRetryCap{ 2000 };
        double       snapshotRetryJitter = 0.2;

        enum class VerifyErrorCode
        {
            Success = 0, // 0 should not represent an error
            InvalidBatchSize,
            InvalidTimeout,
            InvalidRetryCount,
            InvalidHealthCheck,
        };

        static std::shared_ptr<FederationOptions> DefaultOptions()
        {
            return std::make_shared<FederationOptions>();
        }

        /** Verifies FederationOptions */
        outcome::result<VerifyErrorCode> Verify() const
        {
            if ( reconcileBatchSize == 0 || scanBatchSize == 0 )
            {
                return VerifyErrorCode::InvalidBatchSize;
            }
            if ( minOpenTimeout.count() <= 0 || openTimeout < minOpenTimeout || openTimeoutStep.count() < 0 )
            {
                return VerifyErrorCode::InvalidTimeout;
            }
            if ( historicalSyncPollInterval.count() <= 0 || subscriberPollInterval.count() <= 0 )
            {
                return VerifyErrorCode::InvalidTimeout;
            }
            if ( snapshotOpenTimeout.count() <= 0 )
            {
                return VerifyErrorCode::InvalidTimeout;
            }
            if ( maxConnectAttempts <= 0 || maxReconnectAttempts <= 0 || snapshotOpenAttempts <= 0 )
            {
                return VerifyErrorCode::InvalidRetryCount;
            }
            if ( healthCheckInterval.count() <= 0 || maxIdle.count() <= 0 )
            {
                return VerifyErrorCode::InvalidHealthCheck;
            }
            return VerifyErrorCode::Success;
        }
    };
} // namespace fedsync::federation

#endif // FEDSYNC_FEDERATION_OPTIONS_HPP
