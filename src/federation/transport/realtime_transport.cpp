#include "federation/transport/realtime_transport.hpp"

namespace fedsync::federation
{
    std::shared_ptr<RealTimeTransport> RealTimeTransport::New( std::shared_ptr<SiteDirectory> directory,
                                                               const FederationOptions       &options )
    {
        if ( !directory )
        {
            return nullptr;
        }
        return std::shared_ptr<RealTimeTransport>( new RealTimeTransport( std::move( directory ), options ) );
    }

    RealTimeTransport::RealTimeTransport( std::shared_ptr<SiteDirectory> directory, const FederationOptions &options ) :
        directory_( std::move( directory ) ),
        snapshotOpenTimeout_( options.snapshotOpenTimeout ),
        snapshotBackoff_( options.snapshotRetryBase,
                          options.snapshotRetryCap,
                          options.snapshotOpenAttempts,
                          options.snapshotRetryJitter )
    {
    }

    RealTimeTransport::~RealTimeTransport()
    {
        std::lock_guard lock( mutex_ );
        for ( auto &[edgeId, observation] : observations_ )
        {
            Release( observation );
        }
        observations_.clear();
    }

    outcome::result<void> RealTimeTransport::Start( const FollowEdge &edge, std::chrono::milliseconds openTimeout )
    {
        Stop( edge.id() );

        OUTCOME_TRY( ( auto &&, store ),
                     directory_->Open( edge.target_address(), SiteDirectory::OpenMode::Observe, openTimeout ) );

        FollowEdge  filter_edge = edge;
        std::string edge_id     = edge.id();
        auto        listener    = store->AddChangeListener(
            [weak_instance = weak_from_this(), edge_id, filter_edge]( const std::vector<ContentItem> &added,
                                                                      const std::vector<ContentItem> &removed )
            {
                auto instance = weak_instance.lock();
                if ( !instance )
                {
                    return;
                }
                std::vector<ContentItem> accepted;
                for ( const auto &item : added )
                {
                    if ( PassesRecursionRule( filter_edge, item ) )
                    {
                        accepted.push_back( item );
                    }
                }
                instance->Deliver( edge_id, std::move( accepted ), false, true );
                instance->Deliver( edge_id, removed, true, true );
            } );

        std::lock_guard lock( mutex_ );
        observations_[edge.id()] = Observation{ edge.target_address(), store, listener };
        m_logger->debug( "Observing {} for edge {}", edge.target_address(), edge.id() );
        return outcome::success();
    }

    void RealTimeTransport::Stop( const std::string &edgeId )
    {
        std::lock_guard lock( mutex_ );
        auto            it = observations_.find( edgeId );
        if ( it == observations_.end() )
        {
            return;
        }
        Release( it->second );
        observations_.erase( it );
        m_logger->debug( "Stopped observing for edge {}", edgeId );
    }

    void RealTimeTransport::Release( Observation &observation )
    {
        if ( observation.store )
        {
            observation.store->RemoveChangeListener( observation.listener );
        }
        directory_->Close( observation.address, SiteDirectory::OpenMode::Observe );
        observation.store.reset();
    }

    outcome::result<std::vector<ContentItem>> RealTimeTransport::Snapshot( const FollowEdge &edge, size_t limit )
    {
        std::shared_ptr<content::ContentStore> store;
        {
            std::lock_guard lock( mutex_ );
            auto            it = observations_.find( edge.id() );
            if ( it != observations_.end() )
            {
                store = it->second.store;
            }
        }
        bool transient = false;
        if ( !store )
        {
            OUTCOME_TRY( ( auto &&, opened ),
                         directory_->OpenWithRetry( edge.target_address(),
                                                    SiteDirectory::OpenMode::Observe,
                                                    snapshotOpenTimeout_,
                                                    snapshotBackoff_,
                                                    CancellationToken() ) );
            store     = opened;
            transient = true;
        }

        content::ContentQuery query;
        query.filter = [edge]( const ContentItem &item ) { return PassesRecursionRule( edge, item ); };
        query.limit  = limit;
        auto items   = store->Search( query );
        if ( transient )
        {
            directory_->Close( edge.target_address(), SiteDirectory::OpenMode::Observe );
        }
        return items;
    }
} // namespace fedsync::federation
