#include "federation/session_manager.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>

namespace
{
    int64_t SteadyNowMillis()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now().time_since_epoch() )
            .count();
    }
}

namespace fedsync::federation
{
    SessionManager::Session::Session( FollowEdge e, boost::asio::io_context &ctx ) :
        edge( std::move( e ) ),
        strand( boost::asio::make_strand( ctx ) ),
        healthTimer( strand ),
        retryTimer( strand )
    {
    }

    std::shared_ptr<SessionManager> SessionManager::New( std::shared_ptr<boost::asio::io_context> ctx,
                                                         std::shared_ptr<ReconciliationEngine>    engine,
                                                         std::shared_ptr<Transport>               transport,
                                                         const FederationOptions                 &options )
    {
        if ( !ctx || !engine || !transport )
        {
            return nullptr;
        }
        auto verified = options.Verify();
        if ( !verified || verified.value() != FederationOptions::VerifyErrorCode::Success )
        {
            return nullptr;
        }
        auto instance = std::shared_ptr<SessionManager>(
            new SessionManager( std::move( ctx ), std::move( engine ), std::move( transport ), options ) );

        instance->transport_->SetDeliveryHandler(
            [weak_instance = std::weak_ptr<SessionManager>( instance )]( const std::string       &edgeId,
                                                                         std::vector<ContentItem> items,
                                                                         bool                     isRemoval,
                                                                         bool                     realtime )
            {
                if ( auto manager = weak_instance.lock() )
                {
                    manager->OnDelivery( edgeId, std::move( items ), isRemoval, realtime );
                }
            } );
        return instance;
    }

    SessionManager::SessionManager( std::shared_ptr<boost::asio::io_context> ctx,
                                    std::shared_ptr<ReconciliationEngine>    engine,
                                    std::shared_ptr<Transport>               transport,
                                    const FederationOptions                 &options ) :
        ctx_( std::move( ctx ) ),
        engine_( std::move( engine ) ),
        transport_( std::move( transport ) ),
        options_( options ),
        connectBackoff_( options.connectBackoffBase, options.connectBackoffCap, options.maxConnectAttempts ),
        reconnectBackoff_( options.reconnectBackoffBase, options.reconnectBackoffCap, options.maxReconnectAttempts )
    {
    }

    SessionManager::~SessionManager()
    {
        transport_->SetDeliveryHandler( nullptr );
        StopAll();
    }

    std::chrono::milliseconds SessionManager::OpenTimeout( int attempt ) const
    {
        return std::max( options_.minOpenTimeout, options_.openTimeout - options_.openTimeoutStep * attempt );
    }

    void SessionManager::AddEdge( const FollowEdge &edge )
    {
        RemoveEdge( edge.id() );

        auto session = std::make_shared<Session>( edge, *ctx_ );
        session->lastActivity.store( SteadyNowMillis() );
        {
            std::lock_guard lock( sessionsMutex_ );
            sessions_[edge.id()] = session;
        }
        m_logger->info( "Session for edge {} to {} created using {} transport",
                        edge.id(),
                        edge.target_address(),
                        transport_->Name() );

        boost::asio::post( session->strand,
                           [weak_instance = weak_from_this(), session]
                           {
                               if ( auto instance = weak_instance.lock() )
                               {
                                   instance->Connect( session );
                                   std::lock_guard lock( session->mutex );
                                   if ( !session->token.IsCancelled() )
                                   {
                                       instance->ScheduleHealthCheck( session );
                                   }
                               }
                           } );
    }

    bool SessionManager::RemoveEdge( const std::string &edgeId )
    {
        SessionPtr session;
        {
            std::lock_guard lock( sessionsMutex_ );
            auto            it = sessions_.find( edgeId );
            if ( it == sessions_.end() )
            {
                return false;
            }
            session = it->second;
        }
        Shutdown( session );
        {
            std::lock_guard lock( sessionsMutex_ );
            auto            it = sessions_.find( edgeId );
            if ( it != sessions_.end() && it->second == session )
            {
                sessions_.erase( it );
            }
        }
        m_logger->info( "Session for edge {} removed", edgeId );
        return true;
    }

    void SessionManager::Shutdown( const SessionPtr &session )
    {
        {
            std::lock_guard lock( session->mutex );
            session->token.Cancel();
            session->healthTimer.cancel();
            session->retryTimer.cancel();
        }
        transport_->Stop( session->edge.id() );
    }

    void SessionManager::StopAll()
    {
        std::map<std::string, SessionPtr> sessions;
        {
            std::lock_guard lock( sessionsMutex_ );
            sessions.swap( sessions_ );
        }
        for ( auto &[edgeId, session] : sessions )
        {
            Shutdown( session );
        }
        if ( !sessions.empty() )
        {
            m_logger->info( "Stopped {} sessions", sessions.size() );
        }
    }

    SessionManager::SessionPtr SessionManager::FindSession( const std::string &edgeId ) const
    {
        std::lock_guard lock( sessionsMutex_ );
        auto            it = sessions_.find( edgeId );
        if ( it == sessions_.end() )
        {
            return nullptr;
        }
        return it->second;
    }

    std::optional<SessionStatus> SessionManager::GetSessionStatus( const std::string &edgeId ) const
    {
        auto session = FindSession( edgeId );
        if ( !session )
        {
            return std::nullopt;
        }
        return session->status.load();
    }

    std::vector<SessionManager::SessionInfo> SessionManager::GetSessions() const
    {
        std::vector<SessionInfo> infos;
        std::lock_guard          lock( sessionsMutex_ );
        infos.reserve( sessions_.size() );
        for ( const auto &[edgeId, session] : sessions_ )
        {
            SessionInfo info;
            info.edgeId            = edgeId;
            info.targetAddress     = session->edge.target_address();
            info.status            = session->status.load();
            info.connectAttempts   = session->connectAttempts.load();
            info.reconnectAttempts = session->reconnectAttempts.load();
            {
                std::lock_guard stats_lock( session->statsMutex );
                info.totals = session->totals;
            }
            infos.push_back( std::move( info ) );
        }
        return infos;
    }

    size_t SessionManager::SessionCount() const
    {
        std::lock_guard lock( sessionsMutex_ );
        return sessions_.size();
    }

    void SessionManager::SetStatus( const SessionPtr &session, SessionStatus status )
    {
        auto previous = session->status.exchange( status );
        if ( previous != status )
        {
            m_logger->info( "Edge {}: {} -> {}", session->edge.id(), ToString( previous ), ToString( status ) );
        }
    }

    void SessionManager::Connect( const SessionPtr &session )
    {
        std::lock_guard lock( session->mutex );
        if ( session->token.IsCancelled() || session->status.load() == SessionStatus::Active )
        {
            return;
        }
        const bool background = session->status.load() == SessionStatus::Failed;
        const int  attempt    = session->connectAttempts.load();
        auto       timeout    = background ? options_.minOpenTimeout : OpenTimeout( attempt );

        m_logger->debug( "Connecting edge {} to {}, attempt {}, timeout {} ms",
                         session->edge.id(),
                         session->edge.target_address(),
                         attempt + 1,
                         timeout.count() );

        auto started = transport_->Start( session->edge, timeout );
        if ( started )
        {
            Establish( session );
            return;
        }

        m_logger->warn( "Edge {} could not reach {}: {}",
                        session->edge.id(),
                        session->edge.target_address(),
                        started.error().message() );

        if ( background )
        {
            ScheduleRetry( session, options_.backgroundRetryInterval, false );
            return;
        }
        const int failures = ++session->connectAttempts;
        if ( failures >= connectBackoff_.MaxAttempts() )
        {
            Fail( session );
            return;
        }
        ScheduleRetry( session, connectBackoff_.Delay( failures - 1 ), false );
    }

    void SessionManager::Establish( const SessionPtr &session )
    {
        session->connectAttempts.store( 0 );
        session->reconnectAttempts.store( 0 );
        session->lastActivity.store( SteadyNowMillis() );
        SetStatus( session, SessionStatus::Active );
        InitialSync( session );
    }

    void SessionManager::InitialSync( const SessionPtr &session )
    {
        auto snapshot = transport_->Snapshot( session->edge, options_.initialSyncLimit );
        if ( !snapshot )
        {
            m_logger->warn( "Initial sync of edge {} failed: {}", session->edge.id(), snapshot.error().message() );
            return;
        }
        std::vector<ContentItem> accepted;
        for ( const auto &item : snapshot.value() )
        {
            if ( PassesRecursionRule( session->edge, item ) )
            {
                accepted.push_back( item );
            }
        }
        auto result = engine_->Reconcile( session->edge, accepted, {}, false );
        {
            std::lock_guard stats_lock( session->statsMutex );
            session->totals += result;
        }
        m_logger->info( "Initial sync of edge {}: {} imported, {} skipped, {} failed",
                        session->edge.id(),
                        result.imported,
                        result.skipped,
                        result.failed );
    }

    void SessionManager::Fail( const SessionPtr &session )
    {
        SetStatus( session, SessionStatus::Failed );
        m_logger->error( "Edge {} to {} failed, retrying every {} ms",
                         session->edge.id(),
                         session->edge.target_address(),
                         options_.backgroundRetryInterval.count() );
        ScheduleRetry( session, options_.backgroundRetryInterval, false );
    }

    void SessionManager::HealthCheck( const SessionPtr &session )
    {
        std::lock_guard lock( session->mutex );
        if ( session->token.IsCancelled() )
        {
            return;
        }
        switch ( session->status.load() )
        {
            case SessionStatus::Active:
            {
                auto idle = SteadyNowMillis() - session->lastActivity.load();
                if ( idle > options_.maxIdle.count() )
                {
                    m_logger->warn( "Edge {} idle for {} ms", session->edge.id(), idle );
                    SetStatus( session, SessionStatus::Degraded );
                }
                break;
            }
            case SessionStatus::Degraded:
                SetStatus( session, SessionStatus::Reconnecting );
                ScheduleRetry( session, reconnectBackoff_.Delay( session->reconnectAttempts.load() ), true );
                break;
            default:
                break;
        }
        ScheduleHealthCheck( session );
    }

    void SessionManager::Reconnect( const SessionPtr &session )
    {
        std::lock_guard lock( session->mutex );
        if ( session->token.IsCancelled() || session->status.load() != SessionStatus::Reconnecting )
        {
            return;
        }
        transport_->Stop( session->edge.id() );
        auto started = transport_->Start( session->edge, OpenTimeout( session->reconnectAttempts.load() ) );
        if ( started )
        {
            m_logger->info( "Edge {} reconnected to {}", session->edge.id(), session->edge.target_address() );
            Establish( session );
            return;
        }

        const int failures = ++session->reconnectAttempts;
        m_logger->warn( "Edge {} reconnect {} failed: {}", session->edge.id(), failures, started.error().message() );
        if ( failures >= reconnectBackoff_.MaxAttempts() )
        {
            Fail( session );
            return;
        }
        ScheduleRetry( session, reconnectBackoff_.Delay( failures ), true );
    }

    void SessionManager::ScheduleHealthCheck( const SessionPtr &session )
    {
        session->healthTimer.expires_after( options_.healthCheckInterval );
        session->healthTimer.async_wait(
            [weak_instance = weak_from_this(), session]( const boost::system::error_code &ec )
            {
                if ( ec == boost::asio::error::operation_aborted )
                {
                    return;
                }
                if ( auto instance = weak_instance.lock() )
                {
                    instance->HealthCheck( session );
                }
            } );
    }

    void SessionManager::ScheduleRetry( const SessionPtr &session, std::chrono::milliseconds delay, bool reconnect )
    {
        m_logger->debug( "Edge {}: next {} in {} ms",
                         session->edge.id(),
                         reconnect ? "reconnect" : "connect",
                         delay.count() );
        session->retryTimer.expires_after( delay );
        session->retryTimer.async_wait(
            [weak_instance = weak_from_this(), session, reconnect]( const boost::system::error_code &ec )
            {
                if ( ec == boost::asio::error::operation_aborted )
                {
                    return;
                }
                if ( auto instance = weak_instance.lock() )
                {
                    if ( reconnect )
                    {
                        instance->Reconnect( session );
                    }
                    else
                    {
                        instance->Connect( session );
                    }
                }
            } );
    }

    void SessionManager::OnDelivery( const std::string       &edgeId,
                                     std::vector<ContentItem> items,
                                     bool                     isRemoval,
                                     bool                     realtime )
    {
        auto session = FindSession( edgeId );
        if ( !session )
        {
            m_logger->debug( "Dropping delivery for unknown edge {}", edgeId );
            return;
        }
        boost::asio::post( session->strand,
                           [weak_instance = weak_from_this(), session, items = std::move( items ), isRemoval, realtime]
                           {
                               if ( auto instance = weak_instance.lock() )
                               {
                                   instance->Apply( session, items, isRemoval, realtime );
                               }
                           } );
    }

    void SessionManager::Apply( const SessionPtr               &session,
                                const std::vector<ContentItem> &items,
                                bool                            isRemoval,
                                bool                            realtime )
    {
        std::lock_guard lock( session->mutex );
        if ( session->token.IsCancelled() )
        {
            return;
        }
        auto result = isRemoval ? engine_->Reconcile( session->edge, {}, items, realtime )
                                : engine_->Reconcile( session->edge, items, {}, realtime );
        {
            std::lock_guard stats_lock( session->statsMutex );
            session->totals += result;
        }
        session->lastActivity.store( SteadyNowMillis() );

        auto status = session->status.load();
        if ( status == SessionStatus::Degraded || status == SessionStatus::Reconnecting ||
             status == SessionStatus::Failed )
        {
            session->reconnectAttempts.store( 0 );
            session->connectAttempts.store( 0 );
            session->retryTimer.cancel();
            SetStatus( session, SessionStatus::Active );
        }
        m_logger->debug( "Edge {} delivery: {} imported, {} evicted, {} skipped, {} failed",
                         session->edge.id(),
                         result.imported,
                         result.evicted,
                         result.skipped,
                         result.failed );
    }
} // namespace fedsync::federation
