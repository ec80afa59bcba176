#include "federation/federation_service.hpp"

#include <boost/asio/post.hpp>

#include "federation/transport/message_bus_transport.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( fedsync::federation, FederationService::Error, e )
{
    using ServiceError = fedsync::federation::FederationService::Error;
    switch ( e )
    {
        case ServiceError::INDEX_DISABLED:
            return "The federation index is not enabled on this site";
        case ServiceError::TRANSPORT_UNAVAILABLE:
            return "The configured transport is not available on this node";
        case ServiceError::INVALID_OPTIONS:
            return "Invalid federation options";
    }
    return "Unknown error";
}

namespace fedsync::federation
{
    outcome::result<std::shared_ptr<FederationService>> FederationService::New(
        std::shared_ptr<boost::asio::io_context> ctx,
        std::string                              localAddress,
        std::string                              localName,
        std::shared_ptr<storage::KeyValueStore>  db,
        std::shared_ptr<content::ContentStore>   store,
        std::shared_ptr<TransportRegistry>       registry,
        const FederationOptions                 &options,
        std::shared_ptr<AccessController>        externalAccess )
    {
        if ( !ctx || !db || !store || !registry || localAddress.empty() )
        {
            return Error::INVALID_OPTIONS;
        }
        OUTCOME_TRY( ( auto &&, verified ), options.Verify() );
        if ( verified != FederationOptions::VerifyErrorCode::Success )
        {
            return Error::INVALID_OPTIONS;
        }

        auto transport = registry->Get( options.transport );
        if ( !transport )
        {
            return Error::TRANSPORT_UNAVAILABLE;
        }

        auto instance = std::shared_ptr<FederationService>(
            new FederationService( std::move( localAddress ), std::move( db ), std::move( store ), options ) );
        instance->ctx_       = ctx;
        instance->registry_  = std::move( registry );
        instance->transport_ = transport;

        instance->graph_ = FollowGraphStore::New( instance->db_, instance->localAddress_ );
        if ( options.useFederationIndex )
        {
            instance->index_ = FederationIndex::New( instance->db_, instance->localAddress_, std::move( externalAccess ) );
        }
        instance->engine_ = ReconciliationEngine::New( instance->localAddress_,
                                                       instance->store_,
                                                       instance->index_,
                                                       options.reconcileBatchSize );
        instance->sessions_ = SessionManager::New( ctx, instance->engine_, transport, options );
        if ( !instance->graph_ || !instance->engine_ || !instance->sessions_ )
        {
            return Error::INVALID_OPTIONS;
        }
        instance->m_logger->info( "Federation service of {} ({}) uses the {} transport{}",
                                  instance->localAddress_,
                                  localName,
                                  transport->Name(),
                                  options.useFederationIndex ? " with the federation index" : "" );
        return instance;
    }

    FederationService::FederationService( std::string                             localAddress,
                                          std::shared_ptr<storage::KeyValueStore> db,
                                          std::shared_ptr<content::ContentStore>  store,
                                          const FederationOptions                &options ) :
        localAddress_( std::move( localAddress ) ),
        db_( std::move( db ) ),
        store_( std::move( store ) ),
        options_( options )
    {
    }

    FederationService::~FederationService()
    {
        Stop();
    }

    outcome::result<void> FederationService::Start()
    {
        std::lock_guard lock( lifecycleMutex_ );
        if ( running_ )
        {
            return outcome::success();
        }

        OUTCOME_TRY( ( auto &&, loaded ), graph_->Load() );
        auto edges = graph_->GetEdges();
        if ( index_ )
        {
            BOOST_OUTCOME_TRYV2( auto &&, index_->Load() );
            for ( const auto &edge : edges )
            {
                BOOST_OUTCOME_TRYV2( auto &&, index_->AddFollowedSite( edge.target_address() ) );
            }
        }

        if ( transport_->Kind() == TransportKind::MessageBus )
        {
            localListener_ = store_->AddChangeListener(
                [weak_instance = weak_from_this()]( const std::vector<ContentItem> &added,
                                                    const std::vector<ContentItem> &removed )
                {
                    if ( auto instance = weak_instance.lock() )
                    {
                        instance->OnLocalChange( added, removed );
                    }
                } );
        }

        for ( const auto &edge : edges )
        {
            sessions_->AddEdge( edge );
        }
        running_ = true;
        m_logger->info( "Started with {} follow edges", loaded );
        return outcome::success();
    }

    void FederationService::Stop()
    {
        std::lock_guard lock( lifecycleMutex_ );
        if ( !running_ )
        {
            return;
        }
        if ( localListener_ )
        {
            store_->RemoveChangeListener( *localListener_ );
            localListener_.reset();
        }
        sessions_->StopAll();
        running_ = false;
        m_logger->info( "Stopped" );
    }

    outcome::result<FollowEdge> FederationService::AddFollowEdge( const std::string &targetAddress,
                                                                  const std::string &displayName,
                                                                  bool               recursive )
    {
        OUTCOME_TRY( ( auto &&, edge ), graph_->AddEdge( targetAddress, displayName, recursive ) );
        if ( index_ )
        {
            auto followed = index_->AddFollowedSite( targetAddress );
            if ( followed.has_error() )
            {
                m_logger->error( "Could not add {} to the index follow list: {}",
                                 targetAddress,
                                 followed.error().message() );
                BOOST_OUTCOME_TRYV2( auto &&, graph_->RemoveEdge( edge.id() ) );
                return followed.as_failure();
            }
        }

        std::lock_guard lock( lifecycleMutex_ );
        if ( running_ )
        {
            sessions_->AddEdge( edge );
        }
        m_logger->info( "Following {} ({}recursive)", targetAddress, recursive ? "" : "non " );
        return edge;
    }

    outcome::result<void> FederationService::RemoveFollowEdge( const std::string &edgeId, bool purge )
    {
        OUTCOME_TRY( ( auto &&, edge ), graph_->RemoveEdge( edgeId ) );
        sessions_->RemoveEdge( edgeId );

        if ( purge )
        {
            OUTCOME_TRY( ( auto &&, purged ), engine_->Purge( edge.target_address(), options_.scanBatchSize ) );
            m_logger->info( "Purged {} records of {}", purged, edge.target_address() );
        }
        if ( index_ )
        {
            BOOST_OUTCOME_TRYV2( auto &&, index_->RemoveFollowedSite( edge.target_address() ) );
        }
        m_logger->info( "Unfollowed {}", edge.target_address() );
        return outcome::success();
    }

    std::vector<FollowEdge> FederationService::GetFollowEdges() const
    {
        return graph_->GetEdges();
    }

    std::optional<SessionStatus> FederationService::GetSessionStatus( const std::string &edgeId ) const
    {
        return sessions_->GetSessionStatus( edgeId );
    }

    std::vector<SessionManager::SessionInfo> FederationService::GetSessions() const
    {
        return sessions_->GetSessions();
    }

    bool FederationService::IsLocalOrigin( const std::string &origin ) const
    {
        return origin.empty() || origin == localAddress_;
    }

    bool FederationService::CanPerformFederatedWrite( const std::string &origin, bool isDelete ) const
    {
        if ( IsLocalOrigin( origin ) || isDelete )
        {
            return true;
        }
        if ( graph_->IsFollowing( origin ) )
        {
            return true;
        }
        // Content of a followed site's own follows arrives through recursive edges
        for ( const auto &edge : graph_->GetEdges() )
        {
            if ( edge.recursive() )
            {
                return true;
            }
        }
        m_logger->warn( "Denied federated write from {}", origin );
        return false;
    }

    content::ContentStore::WritePolicy FederationService::MakeWritePolicy()
    {
        return [weak_instance = weak_from_this()]( const ContentItem &item, bool isDelete )
        {
            auto instance = weak_instance.lock();
            if ( !instance )
            {
                return false;
            }
            return instance->CanPerformFederatedWrite( item.has_federated_from() ? item.federated_from() : "",
                                                       isDelete );
        };
    }

    void FederationService::OnLocalChange( const std::vector<ContentItem> &added, const std::vector<ContentItem> &removed )
    {
        // Federated copies are relayed too, followers apply their own recursion rule
        if ( added.empty() && removed.empty() )
        {
            return;
        }

        auto publisher = registry_->GetMessageBusTransport();
        if ( !publisher )
        {
            return;
        }
        boost::asio::post( *ctx_,
                           [this_logger = m_logger,
                            publisher,
                            added_items   = added,
                            removed_items = removed]
                           {
                               auto published = publisher->PublishLocalChanges( added_items, removed_items );
                               if ( published.has_error() )
                               {
                                   this_logger->error( "Publishing local changes failed: {}",
                                                       published.error().message() );
                               }
                           } );
    }

    outcome::result<std::shared_ptr<FederationIndex>> FederationService::RequireIndex() const
    {
        if ( !index_ )
        {
            return Error::INDEX_DISABLED;
        }
        return index_;
    }

    outcome::result<std::vector<FederationIndexEntry>> FederationService::GetFederationIndexRecent( size_t limit,
                                                                                                    size_t offset ) const
    {
        OUTCOME_TRY( ( auto &&, index ), RequireIndex() );
        return index->GetRecent( limit, offset );
    }

    outcome::result<std::vector<FederationIndexEntry>> FederationService::GetFederationIndexByCategory(
        const std::string &categoryId,
        size_t             limit ) const
    {
        OUTCOME_TRY( ( auto &&, index ), RequireIndex() );
        return index->GetByCategory( categoryId, limit );
    }

    outcome::result<std::vector<FederationIndexEntry>> FederationService::SearchFederationIndex(
        const std::string &text ) const
    {
        OUTCOME_TRY( ( auto &&, index ), RequireIndex() );
        return index->Search( text );
    }

    outcome::result<std::vector<FederationIndexEntry>> FederationService::ComplexFederationIndexQuery(
        const IndexQuery &query ) const
    {
        OUTCOME_TRY( ( auto &&, index ), RequireIndex() );
        return index->ComplexQuery( query );
    }

    outcome::result<IndexStats> FederationService::GetFederationIndexStats() const
    {
        OUTCOME_TRY( ( auto &&, index ), RequireIndex() );
        return index->GetStats();
    }
} // namespace fedsync::federation
