#include "federation/site_directory.hpp"

#include "content/kv_content_store.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( fedsync::federation, SiteDirectory::Error, e )
{
    using E = fedsync::federation::SiteDirectory::Error;
    switch ( e )
    {
        case E::SITE_UNREACHABLE:
            return "Site could not be reached";
        case E::OPEN_TIMEOUT:
            return "Timed out opening the site";
    }
    return "Unknown error";
}

namespace fedsync::federation
{
    outcome::result<std::shared_ptr<content::ContentStore>> SiteDirectory::OpenWithRetry( const std::string        &address,
                                                                                          OpenMode                  mode,
                                                                                          std::chrono::milliseconds timeout,
                                                                                          const Backoff            &backoff,
                                                                                          const CancellationToken  &token )
    {
        std::shared_ptr<content::ContentStore> opened;
        BOOST_OUTCOME_TRYV2( auto &&,
                             backoff.Retry(
                                 [this, &address, mode, timeout, &opened]( int ) -> outcome::result<void>
                                 {
                                     OUTCOME_TRY( ( auto &&, store ), Open( address, mode, timeout ) );
                                     opened = store;
                                     return outcome::success();
                                 },
                                 token ) );
        return opened;
    }

    InProcessSiteDirectory::~InProcessSiteDirectory()
    {
        std::lock_guard lock( mutex_ );
        for ( auto &[address, replica] : replicas_ )
        {
            replica.source->RemoveChangeListener( replica.listener );
        }
    }

    void InProcessSiteDirectory::Register( const std::string &address, std::shared_ptr<content::ContentStore> store )
    {
        std::lock_guard lock( mutex_ );
        sites_[address] = std::move( store );
    }

    void InProcessSiteDirectory::Unregister( const std::string &address )
    {
        std::lock_guard lock( mutex_ );
        sites_.erase( address );
    }

    outcome::result<std::shared_ptr<content::ContentStore>> InProcessSiteDirectory::Open( const std::string &address,
                                                                                          OpenMode           mode,
                                                                                          std::chrono::milliseconds )
    {
        std::lock_guard lock( mutex_ );
        auto            it = sites_.find( address );
        if ( it == sites_.end() )
        {
            m_logger->debug( "Site {} is not reachable", address );
            return Error::SITE_UNREACHABLE;
        }
        if ( mode == OpenMode::Observe )
        {
            return it->second;
        }
        return OpenReplica( address, it->second );
    }

    outcome::result<std::shared_ptr<content::ContentStore>> InProcessSiteDirectory::OpenReplica(
        const std::string                            &address,
        const std::shared_ptr<content::ContentStore> &source )
    {
        auto existing = replicas_.find( address );
        if ( existing != replicas_.end() )
        {
            ++existing->second.users;
            return existing->second.copy;
        }

        std::shared_ptr<content::ContentStore> copy =
            content::KvContentStore::New( std::make_shared<storage::InMemoryStorage>() );

        // Listen before copying so nothing published in between is missed
        auto listener = source->AddChangeListener(
            [weak_copy = std::weak_ptr<content::ContentStore>( copy ), logger = m_logger](
                const std::vector<content::ContentItem> &added,
                const std::vector<content::ContentItem> &removed )
            {
                auto replica = weak_copy.lock();
                if ( !replica )
                {
                    return;
                }
                for ( const auto &item : added )
                {
                    auto stored = replica->Put( item );
                    if ( stored.has_error() )
                    {
                        logger->error( "Replica failed to store {}: {}", item.id(), stored.error().message() );
                    }
                }
                for ( const auto &item : removed )
                {
                    if ( replica->Has( item.id() ) )
                    {
                        auto deleted = replica->Delete( item.id() );
                        if ( deleted.has_error() )
                        {
                            logger->error( "Replica failed to delete {}: {}", item.id(), deleted.error().message() );
                        }
                    }
                }
            } );

        auto maybe_items = source->Search( content::ContentQuery{} );
        if ( maybe_items.has_error() )
        {
            source->RemoveChangeListener( listener );
            return maybe_items.as_failure();
        }
        for ( const auto &item : maybe_items.value() )
        {
            auto stored = copy->Put( item );
            if ( stored.has_error() )
            {
                source->RemoveChangeListener( listener );
                return stored.as_failure();
            }
        }

        m_logger->info( "Replicated {} items of {}", maybe_items.value().size(), address );
        replicas_.emplace( address, Replica{ source, copy, listener, 1 } );
        return copy;
    }

    void InProcessSiteDirectory::Close( const std::string &address, OpenMode mode )
    {
        if ( mode == OpenMode::Observe )
        {
            return;
        }
        std::lock_guard lock( mutex_ );
        auto            it = replicas_.find( address );
        if ( it == replicas_.end() )
        {
            return;
        }
        if ( --it->second.users == 0 )
        {
            it->second.source->RemoveChangeListener( it->second.listener );
            replicas_.erase( it );
            m_logger->info( "Closed replica of {}", address );
        }
    }

    size_t InProcessSiteDirectory::ReplicaCount() const
    {
        std::lock_guard lock( mutex_ );
        return replicas_.size();
    }
} // namespace fedsync::federation
