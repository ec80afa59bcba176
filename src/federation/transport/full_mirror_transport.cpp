#include "federation/transport/full_mirror_transport.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( fedsync::federation, FullMirrorTransport::Error, e )
{
    using MirrorError = fedsync::federation::FullMirrorTransport::Error;
    switch ( e )
    {
        case MirrorError::SELF_MIRROR:
            return "A node cannot mirror its own collection";
    }
    return "Unknown error";
}

namespace fedsync::federation
{
    std::shared_ptr<FullMirrorTransport> FullMirrorTransport::New( std::string                    localAddress,
                                                                   std::shared_ptr<SiteDirectory> directory,
                                                                   const FederationOptions       &options )
    {
        if ( !directory || localAddress.empty() || options.scanBatchSize == 0 )
        {
            return nullptr;
        }
        return std::shared_ptr<FullMirrorTransport>(
            new FullMirrorTransport( std::move( localAddress ), std::move( directory ), options ) );
    }

    FullMirrorTransport::FullMirrorTransport( std::string                    localAddress,
                                              std::shared_ptr<SiteDirectory> directory,
                                              const FederationOptions       &options ) :
        localAddress_( std::move( localAddress ) ),
        directory_( std::move( directory ) ),
        scanBatchSize_( options.scanBatchSize ),
        snapshotOpenTimeout_( options.snapshotOpenTimeout ),
        snapshotBackoff_( options.snapshotRetryBase,
                          options.snapshotRetryCap,
                          options.snapshotOpenAttempts,
                          options.snapshotRetryJitter )
    {
    }

    FullMirrorTransport::~FullMirrorTransport()
    {
        std::lock_guard lock( mutex_ );
        for ( auto &[edgeId, mirror] : mirrors_ )
        {
            Release( mirror );
        }
        mirrors_.clear();
    }

    outcome::result<void> FullMirrorTransport::Start( const FollowEdge &edge, std::chrono::milliseconds openTimeout )
    {
        if ( edge.target_address() == localAddress_ )
        {
            m_logger->error( "Refusing to mirror the local collection {}", localAddress_ );
            return Error::SELF_MIRROR;
        }
        Stop( edge.id() );

        OUTCOME_TRY( ( auto &&, replica ),
                     directory_->Open( edge.target_address(), SiteDirectory::OpenMode::Replicate, openTimeout ) );

        FollowEdge  filter_edge = edge;
        std::string edge_id     = edge.id();
        auto        listener    = replica->AddChangeListener(
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

        {
            std::lock_guard lock( mutex_ );
            mirrors_[edge.id()] = Mirror{ edge.target_address(), replica, listener };
        }

        auto scanned = Scan( edge, replica );
        if ( scanned.has_error() )
        {
            m_logger->error( "Initial scan of {} failed: {}", edge.target_address(), scanned.error().message() );
            Stop( edge.id() );
            return scanned.as_failure();
        }
        m_logger->info( "Mirroring {} for edge {}, {} items scanned", edge.target_address(), edge.id(), scanned.value() );
        return outcome::success();
    }

    outcome::result<size_t> FullMirrorTransport::Scan( const FollowEdge                             &edge,
                                                       const std::shared_ptr<content::ContentStore> &replica )
    {
        content::ContentQuery query;
        query.filter = [edge]( const ContentItem &item ) { return PassesRecursionRule( edge, item ); };

        auto   cursor    = replica->Iterate( query );
        size_t delivered = 0;
        while ( !cursor->Done() )
        {
            OUTCOME_TRY( ( auto &&, batch ), cursor->Next( scanBatchSize_ ) );
            delivered += batch.size();
            Deliver( edge.id(), std::move( batch ), false, false );
        }
        return delivered;
    }

    void FullMirrorTransport::Stop( const std::string &edgeId )
    {
        std::lock_guard lock( mutex_ );
        auto            it = mirrors_.find( edgeId );
        if ( it == mirrors_.end() )
        {
            return;
        }
        Release( it->second );
        mirrors_.erase( it );
        m_logger->debug( "Stopped mirroring for edge {}", edgeId );
    }

    void FullMirrorTransport::Release( Mirror &mirror )
    {
        if ( mirror.replica )
        {
            mirror.replica->RemoveChangeListener( mirror.listener );
        }
        directory_->Close( mirror.address, SiteDirectory::OpenMode::Replicate );
        mirror.replica.reset();
    }

    outcome::result<std::vector<ContentItem>> FullMirrorTransport::Snapshot( const FollowEdge &edge, size_t limit )
    {
        std::shared_ptr<content::ContentStore> replica;
        {
            std::lock_guard lock( mutex_ );
            auto            it = mirrors_.find( edge.id() );
            if ( it != mirrors_.end() )
            {
                replica = it->second.replica;
            }
        }
        bool transient = false;
        if ( !replica )
        {
            if ( edge.target_address() == localAddress_ )
            {
                return Error::SELF_MIRROR;
            }
            OUTCOME_TRY( ( auto &&, opened ),
                         directory_->OpenWithRetry( edge.target_address(),
                                                    SiteDirectory::OpenMode::Replicate,
                                                    snapshotOpenTimeout_,
                                                    snapshotBackoff_,
                                                    CancellationToken() ) );
            replica   = opened;
            transient = true;
        }

        content::ContentQuery query;
        query.filter = [edge]( const ContentItem &item ) { return PassesRecursionRule( edge, item ); };
        query.limit  = limit;
        auto items   = replica->Search( query );
        if ( transient )
        {
            directory_->Close( edge.target_address(), SiteDirectory::OpenMode::Replicate );
        }
        return items;
    }
} // namespace fedsync::federation
