#include "federation/reconciliation_engine.hpp"

#include <algorithm>
#include <future>

namespace fedsync::federation
{
    std::shared_ptr<ReconciliationEngine> ReconciliationEngine::New( std::string                            localAddress,
                                                                     std::shared_ptr<content::ContentStore> store,
                                                                     std::shared_ptr<FederationIndex>       index,
                                                                     size_t                                 batchSize )
    {
        if ( localAddress.empty() || !store )
        {
            return nullptr;
        }
        return std::shared_ptr<ReconciliationEngine>( new ReconciliationEngine( std::move( localAddress ),
                                                                                std::move( store ),
                                                                                std::move( index ),
                                                                                batchSize == 0 ? DEFAULT_BATCH_SIZE
                                                                                               : batchSize ) );
    }

    ReconciliationEngine::ReconciliationEngine( std::string                            localAddress,
                                                std::shared_ptr<content::ContentStore> store,
                                                std::shared_ptr<FederationIndex>       index,
                                                size_t                                 batchSize ) :
        localAddress_( std::move( localAddress ) ),
        store_( std::move( store ) ),
        index_( std::move( index ) ),
        batchSize_( batchSize ),
        clock_( &base::NowMillis )
    {
    }

    void ReconciliationEngine::SetClock( Clock clock )
    {
        clock_ = clock ? std::move( clock ) : Clock( &base::NowMillis );
    }

    ReconcileResult ReconciliationEngine::Reconcile( const FollowEdge               &edge,
                                                     const std::vector<ContentItem> &added,
                                                     const std::vector<ContentItem> &removed,
                                                     bool                            realtime )
    {
        ReconcileResult result;
        if ( edge.target_address() == localAddress_ )
        {
            m_logger->error( "Refusing to reconcile a self edge {}", edge.id() );
            result.skipped = added.size() + removed.size();
            return result;
        }

        if ( !added.empty() )
        {
            result += RunBatches( added,
                                  [this, &edge, realtime]( const ContentItem &item )
                                  { return Import( edge, item, realtime ); } );
        }
        if ( !removed.empty() )
        {
            result += RunBatches( removed, [this, &edge]( const ContentItem &item ) { return Evict( edge, item ); } );
        }

        m_logger->debug( "Reconciled {} from {}: {} imported, {} evicted, {} skipped, {} failed",
                         edge.id(),
                         edge.target_address(),
                         result.imported,
                         result.evicted,
                         result.skipped,
                         result.failed );
        return result;
    }

    ReconcileResult ReconciliationEngine::RunBatches(
        const std::vector<ContentItem>                                        &items,
        const std::function<outcome::result<Decision>( const ContentItem & )> &apply )
    {
        ReconcileResult result;
        for ( size_t start = 0; start < items.size(); start += batchSize_ )
        {
            auto end = std::min( items.size(), start + batchSize_ );

            std::vector<std::future<outcome::result<Decision>>> pending;
            pending.reserve( end - start );
            for ( size_t i = start; i < end; ++i )
            {
                pending.push_back( std::async( std::launch::async, apply, std::cref( items[i] ) ) );
            }

            for ( size_t i = start; i < end; ++i )
            {
                const auto &item = items[i];
                try
                {
                    auto decision = pending[i - start].get();
                    if ( decision.has_error() )
                    {
                        m_logger->error( "Failed to reconcile {}: {}", item.id(), decision.error().message() );
                        ++result.failed;
                        result.failedIds.push_back( item.id() );
                        continue;
                    }
                    switch ( decision.value() )
                    {
                        case Decision::Imported:
                            ++result.imported;
                            break;
                        case Decision::Evicted:
                            ++result.evicted;
                            break;
                        case Decision::Skipped:
                            ++result.skipped;
                            break;
                    }
                }
                catch ( const std::exception &e )
                {
                    m_logger->error( "Exception reconciling {}: {}", item.id(), e.what() );
                    ++result.failed;
                    result.failedIds.push_back( item.id() );
                }
            }
        }
        return result;
    }

    outcome::result<ReconciliationEngine::Decision> ReconciliationEngine::Import( const FollowEdge  &edge,
                                                                                  const ContentItem &item,
                                                                                  bool               realtime )
    {
        if ( !PassesRecursionRule( edge, item ) )
        {
            m_logger->trace( "{} was federated from {}, edge {} is not recursive",
                             item.id(),
                             item.federated_from(),
                             edge.id() );
            return Decision::Skipped;
        }

        const bool  hasOrigin = item.has_federated_from() && !item.federated_from().empty();
        std::string origin    = hasOrigin ? item.federated_from() : edge.target_address();
        if ( origin == localAddress_ )
        {
            m_logger->trace( "{} originated here, not importing it back", item.id() );
            return Decision::Skipped;
        }

        if ( index_ )
        {
            return ImportPointer( edge, item, origin );
        }

        if ( store_->Has( item.id() ) )
        {
            m_logger->trace( "{} already present", item.id() );
            return Decision::Skipped;
        }

        ContentItem federated = item;
        federated.set_federated_from( origin );
        federated.set_federated_at( clock_() );
        federated.set_federated_realtime( realtime );

        auto maybe_hash = store_->Put( federated );
        if ( maybe_hash.has_error() )
        {
            if ( maybe_hash.error() == content::ContentStore::Error::WRITE_DENIED )
            {
                return Decision::Skipped;
            }
            return maybe_hash.as_failure();
        }
        m_logger->trace( "Imported {} from {} (origin {})", item.id(), edge.target_address(), origin );
        return Decision::Imported;
    }

    outcome::result<ReconciliationEngine::Decision> ReconciliationEngine::Evict( const FollowEdge  &edge,
                                                                                 const ContentItem &item )
    {
        if ( index_ )
        {
            return EvictPointer( edge, item );
        }

        auto maybe_local = store_->Get( item.id() );
        if ( maybe_local.has_error() )
        {
            return Decision::Skipped;
        }
        const auto &local = maybe_local.value();
        if ( !local.has_federated_from() || local.federated_from() != edge.target_address() )
        {
            m_logger->trace( "Keeping {}: local copy is not from {}", item.id(), edge.target_address() );
            return Decision::Skipped;
        }

        auto deleted = store_->Delete( item.id() );
        if ( deleted.has_error() )
        {
            if ( deleted.error() == content::ContentStore::Error::WRITE_DENIED ||
                 deleted.error() == content::ContentStore::Error::NOT_FOUND )
            {
                return Decision::Skipped;
            }
            return deleted.as_failure();
        }
        m_logger->trace( "Evicted {} removed at {}", item.id(), edge.target_address() );
        return Decision::Evicted;
    }

    outcome::result<ReconciliationEngine::Decision> ReconciliationEngine::ImportPointer( const FollowEdge  &edge,
                                                                                         const ContentItem &item,
                                                                                         const std::string &origin )
    {
        auto id = FederationIndex::MakeEntryId( origin, item.content_locator() );
        if ( index_->Has( id ) )
        {
            return Decision::Skipped;
        }

        ContentItem stamped = item;
        stamped.set_federated_at( clock_() );
        auto entry = FederationIndex::EntryFromContent( stamped,
                                                        origin,
                                                        origin == edge.target_address() ? edge.display_name() : origin );

        auto inserted = index_->Insert( std::move( entry ), edge.target_address() );
        if ( inserted.has_error() )
        {
            if ( inserted.error() == FederationIndex::Error::UNAUTHORIZED )
            {
                return Decision::Skipped;
            }
            return inserted.as_failure();
        }
        return Decision::Imported;
    }

    outcome::result<ReconciliationEngine::Decision> ReconciliationEngine::EvictPointer( const FollowEdge  &edge,
                                                                                        const ContentItem &item )
    {
        const bool hasOrigin = item.has_federated_from() && !item.federated_from().empty();
        auto       id = FederationIndex::MakeEntryId( hasOrigin ? item.federated_from() : edge.target_address(),
                                                item.content_locator() );

        auto maybe_entry = index_->Get( id );
        if ( maybe_entry.has_error() || maybe_entry.value().source_site_id() != edge.target_address() )
        {
            return Decision::Skipped;
        }
        auto removed = index_->Remove( id, edge.target_address() );
        if ( removed.has_error() )
        {
            if ( removed.error() == FederationIndex::Error::UNAUTHORIZED ||
                 removed.error() == FederationIndex::Error::ENTRY_NOT_FOUND )
            {
                return Decision::Skipped;
            }
            return removed.as_failure();
        }
        return Decision::Evicted;
    }

    outcome::result<size_t> ReconciliationEngine::Purge( const std::string &siteAddress, size_t scanBatchSize )
    {
        size_t purged = 0;
        if ( index_ )
        {
            for ( const auto &entry : index_->GetBySite( siteAddress, 0 ) )
            {
                auto removed = index_->Remove( entry.id(), index_->GetOwner() );
                if ( removed.has_error() )
                {
                    m_logger->warn( "Could not purge index entry {}: {}", entry.id(), removed.error().message() );
                    continue;
                }
                ++purged;
            }
            m_logger->info( "Purged {} index entries from {}", purged, siteAddress );
            return purged;
        }

        content::ContentQuery query;
        query.filter = [&siteAddress]( const ContentItem &item )
        { return item.has_federated_from() && item.federated_from() == siteAddress; };

        auto cursor = store_->Iterate( query );
        while ( !cursor->Done() )
        {
            OUTCOME_TRY( ( auto &&, batch ), cursor->Next( scanBatchSize ) );
            for ( const auto &item : batch )
            {
                auto deleted = store_->Delete( item.id() );
                if ( deleted.has_error() )
                {
                    m_logger->warn( "Could not purge {}: {}", item.id(), deleted.error().message() );
                    continue;
                }
                ++purged;
            }
        }
        m_logger->info( "Purged {} items federated from {}", purged, siteAddress );
        return purged;
    }
} // namespace fedsync::federation
