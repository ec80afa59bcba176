/**
 * @file       session_manager.hpp
 * @brief      Lifecycle of the subscription session of every follow edge
 */
#ifndef FEDSYNC_SESSION_MANAGER_HPP
#define FEDSYNC_SESSION_MANAGER_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "base/logger.hpp"
#include "federation/backoff.hpp"
#include "federation/federation_options.hpp"
#include "federation/reconciliation_engine.hpp"
#include "federation/transport/transport.hpp"

namespace fedsync::federation
{
    /**
     * @brief Runs one session per follow edge on the shared io_context.
     * A session connects through the transport with shrinking open timeouts,
     * watches its own liveness and reconnects with exponential backoff.
     * Deliveries of one edge are reconciled in arrival order on the edge's
     * strand, different edges run in parallel.
     */
    class SessionManager : public std::enable_shared_from_this<SessionManager>
    {
    public:
        /**
         * @brief Diagnostic view of one session
         */
        struct SessionInfo
        {
            std::string     edgeId;
            std::string     targetAddress;
            SessionStatus   status            = SessionStatus::Connecting;
            int             connectAttempts   = 0;
            int             reconnectAttempts = 0;
            ReconcileResult totals;
        };

        /**
         * @brief Create a manager delivering through @param transport
         * @param ctx io_context the caller runs
         * @param engine reconciliation applied to every delivery
         * @return nullptr on a missing collaborator or invalid @param options
         */
        static std::shared_ptr<SessionManager> New( std::shared_ptr<boost::asio::io_context> ctx,
                                                    std::shared_ptr<ReconciliationEngine>    engine,
                                                    std::shared_ptr<Transport>               transport,
                                                    const FederationOptions                 &options );

        ~SessionManager();

        /**
         * @brief Open the session of @param edge. Replaces an existing session of the same edge.
         */
        void AddEdge( const FollowEdge &edge );

        /**
         * @brief Tear down the session of @param edgeId. Idempotent.
         * @return true if a session was removed
         */
        bool RemoveEdge( const std::string &edgeId );

        /** Tear down every session */
        void StopAll();

        std::optional<SessionStatus> GetSessionStatus( const std::string &edgeId ) const;

        std::vector<SessionInfo> GetSessions() const;

        size_t SessionCount() const;

        /**
         * @brief Open timeout of the zero based connection @param attempt
         */
        std::chrono::milliseconds OpenTimeout( int attempt ) const;

    private:
        using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

        struct Session
        {
            Session( FollowEdge e, boost::asio::io_context &ctx );

            FollowEdge                edge;
            Strand                    strand;
            boost::asio::steady_timer healthTimer;
            boost::asio::steady_timer retryTimer;
            CancellationToken         token;

            /// Serializes strand handlers with removal
            std::mutex mutex;

            std::atomic<SessionStatus> status{ SessionStatus::Connecting };
            std::atomic<int>           connectAttempts{ 0 };
            std::atomic<int>           reconnectAttempts{ 0 };
            std::atomic<int64_t>       lastActivity{ 0 };

            mutable std::mutex statsMutex;
            ReconcileResult    totals;
        };
        using SessionPtr = std::shared_ptr<Session>;

        SessionManager( std::shared_ptr<boost::asio::io_context> ctx,
                        std::shared_ptr<ReconciliationEngine>    engine,
                        std::shared_ptr<Transport>               transport,
                        const FederationOptions                 &options );

        SessionPtr FindSession( const std::string &edgeId ) const;

        void Connect( const SessionPtr &session );
        void Establish( const SessionPtr &session );
        void InitialSync( const SessionPtr &session );
        void HealthCheck( const SessionPtr &session );
        void Reconnect( const SessionPtr &session );
        void Fail( const SessionPtr &session );

        void ScheduleHealthCheck( const SessionPtr &session );
        void ScheduleRetry( const SessionPtr &session, std::chrono::milliseconds delay, bool reconnect );

        void OnDelivery( const std::string &edgeId, std::vector<ContentItem> items, bool isRemoval, bool realtime );
        void Apply( const SessionPtr &session, const std::vector<ContentItem> &items, bool isRemoval, bool realtime );

        void Shutdown( const SessionPtr &session );

        void SetStatus( const SessionPtr &session, SessionStatus status );

        std::shared_ptr<boost::asio::io_context> ctx_;
        std::shared_ptr<ReconciliationEngine>    engine_;
        std::shared_ptr<Transport>               transport_;
        FederationOptions                        options_;
        Backoff                                  connectBackoff_;
        Backoff                                  reconnectBackoff_;

        mutable std::mutex                 sessionsMutex_;
        std::map<std::string, SessionPtr> sessions_;

        base::Logger m_logger = base::createLogger( "SessionManager" );
    };
} // namespace fedsync::federation

#endif // FEDSYNC_SESSION_MANAGER_HPP
