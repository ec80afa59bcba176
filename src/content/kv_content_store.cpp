#include "content/kv_content_store.hpp"

#include "crypto/sha/sha256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( fedsync::content, ContentStore::Error, e )
{
    using E = fedsync::content::ContentStore::Error;
    switch ( e )
    {
        case E::NOT_FOUND:
            return "Content item not found";
        case E::WRITE_DENIED:
            return "Write rejected by the access policy";
        case E::INVALID_ITEM:
            return "Content item has no id";
        case E::CORRUPTED_RECORD:
            return "Stored content record could not be decoded";
    }
    return "Unknown error";
}

namespace fedsync::content
{
    class KvContentStore::Cursor : public ContentCursor
    {
    public:
        Cursor( std::shared_ptr<const KvContentStore> store, std::vector<std::string> ids, ContentQuery query ) :
            store_( std::move( store ) ), ids_( std::move( ids ) ), query_( std::move( query ) )
        {
        }

        outcome::result<std::vector<ContentItem>> Next( size_t batchSize ) override
        {
            std::vector<ContentItem> batch;
            while ( !Done() && batch.size() < batchSize )
            {
                auto maybe_item = store_->Get( ids_[position_++] );
                // Removed since the cursor was opened
                if ( maybe_item.has_error() )
                {
                    continue;
                }
                if ( query_.Matches( maybe_item.value() ) )
                {
                    batch.push_back( std::move( maybe_item.value() ) );
                    ++returned_;
                }
            }
            return batch;
        }

        bool Done() const override
        {
            return position_ >= ids_.size() || ( query_.limit != 0 && returned_ >= query_.limit );
        }

    private:
        std::shared_ptr<const KvContentStore> store_;
        std::vector<std::string>              ids_;
        ContentQuery                          query_;
        size_t                                position_ = 0;
        size_t                                returned_ = 0;
    };

    std::shared_ptr<KvContentStore> KvContentStore::New( std::shared_ptr<storage::KeyValueStore> db,
                                                         WritePolicy                             policy )
    {
        if ( !db )
        {
            return nullptr;
        }
        return std::shared_ptr<KvContentStore>( new KvContentStore( std::move( db ), std::move( policy ) ) );
    }

    KvContentStore::KvContentStore( std::shared_ptr<storage::KeyValueStore> db, WritePolicy policy ) :
        db_( std::move( db ) ), policy_( std::move( policy ) )
    {
    }

    std::string KvContentStore::KeyFor( const std::string &id )
    {
        return std::string( CONTENT_PREFIX ) + id;
    }

    void KvContentStore::SetWritePolicy( WritePolicy policy )
    {
        std::unique_lock lock( policyMutex_ );
        policy_ = std::move( policy );
    }

    bool KvContentStore::IsAllowed( const ContentItem &item, bool isDelete ) const
    {
        std::shared_lock lock( policyMutex_ );
        return !policy_ || policy_( item, isDelete );
    }

    outcome::result<std::string> KvContentStore::Put( const ContentItem &item )
    {
        if ( item.id().empty() )
        {
            return Error::INVALID_ITEM;
        }
        if ( !IsAllowed( item, false ) )
        {
            m_logger->warn( "Put of {} denied by write policy", item.id() );
            return Error::WRITE_DENIED;
        }

        std::string record = item.SerializeAsString();
        auto        hash   = crypto::sha256Hex( record );
        BOOST_OUTCOME_TRYV2( auto &&, db_->put( KeyFor( item.id() ), std::move( record ) ) );

        m_logger->trace( "Stored {} ({})", item.id(), hash );
        Notify( { item }, {} );
        return hash;
    }

    outcome::result<void> KvContentStore::Delete( const std::string &id )
    {
        OUTCOME_TRY( ( auto &&, existing ), Get( id ) );
        if ( !IsAllowed( existing, true ) )
        {
            m_logger->warn( "Delete of {} denied by write policy", id );
            return Error::WRITE_DENIED;
        }
        BOOST_OUTCOME_TRYV2( auto &&, db_->remove( KeyFor( id ) ) );

        m_logger->trace( "Deleted {}", id );
        Notify( {}, { existing } );
        return outcome::success();
    }

    outcome::result<ContentItem> KvContentStore::Get( const std::string &id ) const
    {
        auto maybe_record = db_->get( KeyFor( id ) );
        if ( maybe_record.has_error() )
        {
            return Error::NOT_FOUND;
        }
        ContentItem item;
        if ( !item.ParseFromString( maybe_record.value() ) )
        {
            m_logger->error( "Corrupted content record {}", id );
            return Error::CORRUPTED_RECORD;
        }
        return item;
    }

    bool KvContentStore::Has( const std::string &id ) const
    {
        return db_->contains( KeyFor( id ) );
    }

    outcome::result<std::vector<ContentItem>> KvContentStore::Search( const ContentQuery &query ) const
    {
        OUTCOME_TRY( ( auto &&, records ), db_->query( std::string( CONTENT_PREFIX ) ) );

        std::vector<ContentItem> items;
        for ( const auto &[key, record] : records )
        {
            ContentItem item;
            if ( !item.ParseFromString( record ) )
            {
                m_logger->error( "Skipping corrupted content record {}", key );
                continue;
            }
            if ( !query.Matches( item ) )
            {
                continue;
            }
            items.push_back( std::move( item ) );
            if ( query.limit != 0 && items.size() >= query.limit )
            {
                break;
            }
        }
        return items;
    }

    std::unique_ptr<ContentCursor> KvContentStore::Iterate( const ContentQuery &query ) const
    {
        std::vector<std::string> ids;
        auto                     maybe_records = db_->query( std::string( CONTENT_PREFIX ) );
        if ( maybe_records.has_error() )
        {
            m_logger->error( "Failed to list content: {}", maybe_records.error().message() );
        }
        else
        {
            for ( const auto &entry : maybe_records.value() )
            {
                ids.push_back( entry.first.substr( CONTENT_PREFIX.size() ) );
            }
        }
        return std::make_unique<Cursor>( shared_from_this(), std::move( ids ), query );
    }

    ContentStore::ListenerId KvContentStore::AddChangeListener( ChangeListener listener )
    {
        std::lock_guard lock( listenersMutex_ );
        auto            id = nextListenerId_++;
        listeners_.emplace( id, std::move( listener ) );
        return id;
    }

    void KvContentStore::RemoveChangeListener( ListenerId id )
    {
        std::lock_guard lock( listenersMutex_ );
        listeners_.erase( id );
    }

    void KvContentStore::Notify( const std::vector<ContentItem> &added, const std::vector<ContentItem> &removed )
    {
        std::vector<ChangeListener> listeners;
        {
            std::lock_guard lock( listenersMutex_ );
            for ( const auto &entry : listeners_ )
            {
                listeners.push_back( entry.second );
            }
        }
        for ( const auto &listener : listeners )
        {
            listener( added, removed );
        }
    }
} // namespace fedsync::content
