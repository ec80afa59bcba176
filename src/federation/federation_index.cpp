#include "federation/federation_index.hpp"

#include <algorithm>
#include <mutex>

#include <rapidjson/document.h>

OUTCOME_CPP_DEFINE_CATEGORY_3( fedsync::federation, FederationIndex::Error, e )
{
    using E = fedsync::federation::FederationIndex::Error;
    switch ( e )
    {
        case E::UNAUTHORIZED:
            return "Actor is neither the index owner nor a followed site";
        case E::INVALID_ENTRY:
            return "Index entry needs a source site and a content locator";
        case E::ENTRY_NOT_FOUND:
            return "Index entry not found";
    }
    return "Unknown error";
}

namespace fedsync::federation
{
    namespace
    {
        constexpr std::string_view DEFAULT_CONTENT_TYPE = "video";
        constexpr std::string_view DEFAULT_CATEGORY     = "uncategorized";
        constexpr std::string_view DEFAULT_TITLE        = "Untitled";

        std::optional<std::string> StringMember( const rapidjson::Value &object, const char *name )
        {
            auto member = object.FindMember( name );
            if ( member == object.MemberEnd() || !member->value.IsString() )
            {
                return std::nullopt;
            }
            return std::string( member->value.GetString(), member->value.GetStringLength() );
        }

        bool BoolMember( const rapidjson::Value &object, const char *name )
        {
            auto member = object.FindMember( name );
            return member != object.MemberEnd() && member->value.IsBool() && member->value.GetBool();
        }

        std::optional<base::TimestampMs> TimestampMember( const rapidjson::Value &object, const char *name )
        {
            auto member = object.FindMember( name );
            if ( member == object.MemberEnd() || !member->value.IsNumber() )
            {
                return std::nullopt;
            }
            if ( member->value.IsInt64() )
            {
                return member->value.GetInt64();
            }
            return static_cast<base::TimestampMs>( member->value.GetDouble() );
        }

        bool IsActive( bool flag, bool hasUntil, base::TimestampMs until, base::TimestampMs now )
        {
            return flag && ( !hasUntil || until > now );
        }
    }

    FollowListAccessPolicy::FollowListAccessPolicy( std::string owner, std::shared_ptr<AccessController> external ) :
        owner_( std::move( owner ) ), external_( std::move( external ) )
    {
    }

    bool FollowListAccessPolicy::CanWrite( const std::string &actorKey ) const
    {
        bool allowed = !actorKey.empty() && ( actorKey == owner_ || IsFollowed( actorKey ) );
        if ( allowed && external_ )
        {
            return external_->CanWrite( actorKey );
        }
        return allowed;
    }

    void FollowListAccessPolicy::AddFollowedSite( const std::string &address )
    {
        std::unique_lock lock( mutex_ );
        followed_.insert( address );
    }

    void FollowListAccessPolicy::RemoveFollowedSite( const std::string &address )
    {
        std::unique_lock lock( mutex_ );
        followed_.erase( address );
    }

    bool FollowListAccessPolicy::IsFollowed( const std::string &address ) const
    {
        std::shared_lock lock( mutex_ );
        return followed_.count( address ) != 0;
    }

    std::vector<std::string> FollowListAccessPolicy::GetFollowedSites() const
    {
        std::shared_lock lock( mutex_ );
        return { followed_.begin(), followed_.end() };
    }

    std::shared_ptr<FederationIndex> FederationIndex::New( std::shared_ptr<storage::KeyValueStore> db,
                                                           std::string                             owner,
                                                           std::shared_ptr<AccessController>       external )
    {
        if ( !db || owner.empty() )
        {
            return nullptr;
        }
        auto policy = std::make_shared<FollowListAccessPolicy>( std::move( owner ), std::move( external ) );
        return std::shared_ptr<FederationIndex>( new FederationIndex( std::move( db ), std::move( policy ) ) );
    }

    FederationIndex::FederationIndex( std::shared_ptr<storage::KeyValueStore> db,
                                      std::shared_ptr<FollowListAccessPolicy> policy ) :
        db_( std::move( db ) ), policy_( std::move( policy ) )
    {
    }

    std::string FederationIndex::MakeEntryId( const std::string &sourceSiteId, const std::string &contentLocator )
    {
        return sourceSiteId + ":" + contentLocator;
    }

    FederationIndexEntry FederationIndex::EntryFromContent( const ContentItem &item,
                                                            const std::string &sourceSiteId,
                                                            const std::string &sourceSiteName )
    {
        FederationIndexEntry entry;
        entry.set_id( MakeEntryId( sourceSiteId, item.content_locator() ) );
        entry.set_content_locator( item.content_locator() );
        entry.set_title( item.name().empty() ? std::string( DEFAULT_TITLE ) : item.name() );
        entry.set_category_id( item.category_id().empty() ? std::string( DEFAULT_CATEGORY ) : item.category_id() );
        entry.set_content_type( std::string( DEFAULT_CONTENT_TYPE ) );
        entry.set_source_site_id( sourceSiteId );
        entry.set_source_site_name( sourceSiteName.empty() ? sourceSiteId : sourceSiteName );
        entry.set_timestamp( item.has_federated_at() ? item.federated_at() : base::NowMillis() );
        if ( item.has_thumbnail_locator() )
        {
            entry.set_thumbnail_locator( item.thumbnail_locator() );
        }

        if ( item.has_metadata() && !item.metadata().empty() )
        {
            rapidjson::Document document;
            document.Parse( item.metadata().c_str() );
            if ( !document.HasParseError() && document.IsObject() )
            {
                auto type = StringMember( document, "contentType" );
                if ( !type )
                {
                    type = StringMember( document, "type" );
                }
                if ( type && !type->empty() )
                {
                    entry.set_content_type( *type );
                }
                if ( auto description = StringMember( document, "description" ) )
                {
                    entry.set_description( *description );
                }
                auto tags = document.FindMember( "tags" );
                if ( tags != document.MemberEnd() && tags->value.IsArray() )
                {
                    for ( const auto &tag : tags->value.GetArray() )
                    {
                        if ( tag.IsString() )
                        {
                            entry.add_tags( tag.GetString() );
                        }
                    }
                }
                entry.set_is_featured( BoolMember( document, "isFeatured" ) );
                entry.set_is_promoted( BoolMember( document, "isPromoted" ) );
                if ( auto until = TimestampMember( document, "featuredUntil" ) )
                {
                    entry.set_featured_until( *until );
                }
                if ( auto until = TimestampMember( document, "promotedUntil" ) )
                {
                    entry.set_promoted_until( *until );
                }
            }
        }
        return entry;
    }

    outcome::result<void> FederationIndex::Load()
    {
        OUTCOME_TRY( ( auto &&, records ), db_->query( std::string( FOLLOWED_PREFIX ) ) );
        for ( const auto &entry : records )
        {
            policy_->AddFollowedSite( entry.first.substr( FOLLOWED_PREFIX.size() ) );
        }
        m_logger->debug( "Loaded {} followed sites", records.size() );
        return outcome::success();
    }

    bool FederationIndex::CanWrite( const std::string &actor ) const
    {
        return policy_->CanWrite( actor );
    }

    outcome::result<void> FederationIndex::Insert( FederationIndexEntry entry, const std::string &actor )
    {
        if ( entry.source_site_id().empty() || entry.content_locator().empty() )
        {
            return Error::INVALID_ENTRY;
        }
        if ( !CanWrite( actor ) )
        {
            m_logger->warn( "Index insert by {} denied", actor );
            return Error::UNAUTHORIZED;
        }
        entry.set_id( MakeEntryId( entry.source_site_id(), entry.content_locator() ) );

        BOOST_OUTCOME_TRYV2( auto &&,
                             db_->put( std::string( ENTRY_PREFIX ) + entry.id(), entry.SerializeAsString() ) );
        m_logger->trace( "Indexed {}", entry.id() );
        return outcome::success();
    }

    outcome::result<void> FederationIndex::Remove( const std::string &id, const std::string &actor )
    {
        if ( !CanWrite( actor ) )
        {
            m_logger->warn( "Index removal by {} denied", actor );
            return Error::UNAUTHORIZED;
        }
        OUTCOME_TRY( ( auto &&, existing ), Get( id ) );
        // Followed sites only manage the entries they are the source of
        if ( actor != GetOwner() && existing.source_site_id() != actor )
        {
            m_logger->warn( "{} cannot remove entry {} of {}", actor, id, existing.source_site_id() );
            return Error::UNAUTHORIZED;
        }
        BOOST_OUTCOME_TRYV2( auto &&, db_->remove( std::string( ENTRY_PREFIX ) + id ) );
        m_logger->trace( "Removed index entry {}", id );
        return outcome::success();
    }

    outcome::result<FederationIndexEntry> FederationIndex::Get( const std::string &id ) const
    {
        auto maybe_record = db_->get( std::string( ENTRY_PREFIX ) + id );
        if ( maybe_record.has_error() )
        {
            return Error::ENTRY_NOT_FOUND;
        }
        FederationIndexEntry entry;
        if ( !entry.ParseFromString( maybe_record.value() ) )
        {
            m_logger->error( "Corrupted index entry {}", id );
            return Error::ENTRY_NOT_FOUND;
        }
        return entry;
    }

    bool FederationIndex::Has( const std::string &id ) const
    {
        return db_->contains( std::string( ENTRY_PREFIX ) + id );
    }

    outcome::result<void> FederationIndex::AddFollowedSite( const std::string &address )
    {
        BOOST_OUTCOME_TRYV2( auto &&, db_->put( std::string( FOLLOWED_PREFIX ) + address, address ) );
        policy_->AddFollowedSite( address );
        return outcome::success();
    }

    outcome::result<void> FederationIndex::RemoveFollowedSite( const std::string &address )
    {
        BOOST_OUTCOME_TRYV2( auto &&, db_->remove( std::string( FOLLOWED_PREFIX ) + address ) );
        policy_->RemoveFollowedSite( address );
        return outcome::success();
    }

    std::vector<std::string> FederationIndex::GetFollowedSites() const
    {
        return policy_->GetFollowedSites();
    }

    std::vector<FederationIndexEntry> FederationIndex::GetAllEntries() const
    {
        std::vector<FederationIndexEntry> entries;

        auto maybe_records = db_->query( std::string( ENTRY_PREFIX ) );
        if ( maybe_records.has_error() )
        {
            m_logger->error( "Index storage unreadable, returning no entries: {}", maybe_records.error().message() );
            return entries;
        }
        for ( const auto &[key, record] : maybe_records.value() )
        {
            FederationIndexEntry entry;
            if ( !entry.ParseFromString( record ) )
            {
                m_logger->warn( "Skipping corrupted index record {}", key );
                continue;
            }
            entries.push_back( std::move( entry ) );
        }
        return entries;
    }

    bool FederationIndex::Matches( const FederationIndexEntry &entry, const IndexQuery &query, base::TimestampMs now )
    {
        if ( query.text && !base::ContainsIgnoreCase( entry.title(), *query.text ) &&
             !( entry.has_description() && base::ContainsIgnoreCase( entry.description(), *query.text ) ) )
        {
            return false;
        }
        if ( query.contentType && entry.content_type() != *query.contentType )
        {
            return false;
        }
        if ( query.sourceSiteId && entry.source_site_id() != *query.sourceSiteId )
        {
            return false;
        }
        if ( query.categoryId && entry.category_id() != *query.categoryId )
        {
            return false;
        }
        if ( !query.tags.empty() )
        {
            bool any = std::any_of( entry.tags().begin(),
                                    entry.tags().end(),
                                    [&query]( const std::string &tag )
                                    { return std::find( query.tags.begin(), query.tags.end(), tag ) != query.tags.end(); } );
            if ( !any )
            {
                return false;
            }
        }
        if ( query.afterTimestamp && entry.timestamp() < *query.afterTimestamp )
        {
            return false;
        }
        if ( query.beforeTimestamp && entry.timestamp() > *query.beforeTimestamp )
        {
            return false;
        }
        if ( query.isFeatured &&
             IsActive( entry.is_featured(), entry.has_featured_until(), entry.featured_until(), now ) != *query.isFeatured )
        {
            return false;
        }
        if ( query.isPromoted &&
             IsActive( entry.is_promoted(), entry.has_promoted_until(), entry.promoted_until(), now ) != *query.isPromoted )
        {
            return false;
        }
        return true;
    }

    std::vector<FederationIndexEntry> FederationIndex::ComplexQuery( const IndexQuery &query ) const
    {
        auto now     = query.now.value_or( base::NowMillis() );
        auto entries = GetAllEntries();

        std::vector<FederationIndexEntry> matched;
        for ( auto &entry : entries )
        {
            if ( Matches( entry, query, now ) )
            {
                matched.push_back( std::move( entry ) );
            }
        }

        std::stable_sort( matched.begin(),
                          matched.end(),
                          [&query]( const FederationIndexEntry &lhs, const FederationIndexEntry &rhs )
                          {
                              if ( query.sortBy == IndexQuery::SortBy::Title )
                              {
                                  auto l = base::ToLower( lhs.title() );
                                  auto r = base::ToLower( rhs.title() );
                                  return query.descending ? l > r : l < r;
                              }
                              return query.descending ? lhs.timestamp() > rhs.timestamp()
                                                      : lhs.timestamp() < rhs.timestamp();
                          } );

        if ( query.offset >= matched.size() )
        {
            return {};
        }
        auto first = matched.begin() + static_cast<std::ptrdiff_t>( query.offset );
        auto last  = matched.end();
        if ( query.limit != 0 && query.limit < static_cast<size_t>( last - first ) )
        {
            last = first + static_cast<std::ptrdiff_t>( query.limit );
        }
        return { std::make_move_iterator( first ), std::make_move_iterator( last ) };
    }

    std::vector<FederationIndexEntry> FederationIndex::Search( const std::string &text, IndexQuery options ) const
    {
        options.text = text;
        return ComplexQuery( options );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetByCategory( const std::string &categoryId, size_t limit ) const
    {
        IndexQuery query;
        query.categoryId = categoryId;
        query.limit      = limit;
        return ComplexQuery( query );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetByTags( const std::vector<std::string> &tags,
                                                                  size_t                          limit ) const
    {
        if ( tags.empty() )
        {
            return {};
        }
        IndexQuery query;
        query.tags  = tags;
        query.limit = limit;
        return ComplexQuery( query );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetBySite( const std::string &sourceSiteId, size_t limit ) const
    {
        IndexQuery query;
        query.sourceSiteId = sourceSiteId;
        query.limit        = limit;
        return ComplexQuery( query );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetByType( const std::string &contentType, size_t limit ) const
    {
        IndexQuery query;
        query.contentType = contentType;
        query.limit       = limit;
        return ComplexQuery( query );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetByTimeRange( base::TimestampMs after,
                                                                       base::TimestampMs before,
                                                                       size_t            limit ) const
    {
        IndexQuery query;
        query.afterTimestamp  = after;
        query.beforeTimestamp = before;
        query.limit           = limit;
        return ComplexQuery( query );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetRecent( size_t limit, size_t offset ) const
    {
        IndexQuery query;
        query.limit  = limit;
        query.offset = offset;
        return ComplexQuery( query );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetFeatured( std::optional<base::TimestampMs> now,
                                                                    size_t                           limit ) const
    {
        IndexQuery query;
        query.isFeatured = true;
        query.now        = now;
        query.limit      = limit;
        return ComplexQuery( query );
    }

    std::vector<FederationIndexEntry> FederationIndex::GetPromoted( std::optional<base::TimestampMs> now,
                                                                    size_t                           limit ) const
    {
        IndexQuery query;
        query.isPromoted = true;
        query.now        = now;
        query.limit      = limit;
        return ComplexQuery( query );
    }

    IndexStats FederationIndex::GetStats() const
    {
        IndexStats stats;
        for ( const auto &entry : GetAllEntries() )
        {
            ++stats.totalEntries;
            ++stats.entriesBySite[entry.source_site_id()];
            ++stats.entriesByType[entry.content_type()];
            if ( !stats.oldest || entry.timestamp() < *stats.oldest )
            {
                stats.oldest = entry.timestamp();
            }
            if ( !stats.newest || entry.timestamp() > *stats.newest )
            {
                stats.newest = entry.timestamp();
            }
        }
        return stats;
    }
} // namespace fedsync::federation
