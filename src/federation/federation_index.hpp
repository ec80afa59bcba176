/**
 * @file       federation_index.hpp
 * @brief      Pointer only cache of content published by followed sites
 */
#ifndef FEDSYNC_FEDERATION_INDEX_HPP
#define FEDSYNC_FEDERATION_INDEX_HPP

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>

#include "base/logger.hpp"
#include "base/util.hpp"
#include "federation/access_controller.hpp"
#include "federation/federation_types.hpp"
#include "storage/key_value_store.hpp"

namespace fedsync::federation
{
    /**
     * @brief Selection over the index. Unset fields do not filter.
     */
    struct IndexQuery
    {
        enum class SortBy
        {
            Timestamp,
            Title,
        };

        std::optional<std::string>       text;        ///< case insensitive match on title or description
        std::optional<std::string>       contentType;
        std::optional<std::string>       sourceSiteId;
        std::optional<std::string>       categoryId;
        std::vector<std::string>         tags;        ///< any of them
        std::optional<base::TimestampMs> afterTimestamp;
        std::optional<base::TimestampMs> beforeTimestamp;
        std::optional<bool>              isFeatured;  ///< flag set and not expired at @ref now
        std::optional<bool>              isPromoted;
        std::optional<base::TimestampMs> now;         ///< reference time of the expiry checks, wall clock when unset

        SortBy sortBy     = SortBy::Timestamp;
        bool   descending = true;
        size_t limit      = 50; ///< 0 means unbounded
        size_t offset     = 0;
    };

    struct IndexStats
    {
        size_t                           totalEntries = 0;
        std::map<std::string, size_t>    entriesBySite;
        std::map<std::string, size_t>    entriesByType;
        std::optional<base::TimestampMs> oldest;
        std::optional<base::TimestampMs> newest;
    };

    /**
     * @brief Owner side write policy of the index: the owner is always
     * allowed, sites on the owner's follow list are allowed, anyone else is
     * denied. An external controller, when given, must also agree.
     */
    class FollowListAccessPolicy : public AccessController
    {
    public:
        FollowListAccessPolicy( std::string owner, std::shared_ptr<AccessController> external = nullptr );

        bool CanWrite( const std::string &actorKey ) const override;

        void AddFollowedSite( const std::string &address );
        void RemoveFollowedSite( const std::string &address );
        bool IsFollowed( const std::string &address ) const;

        std::vector<std::string> GetFollowedSites() const;

        const std::string &GetOwner() const
        {
            return owner_;
        }

    private:
        std::string                       owner_;
        std::shared_ptr<AccessController> external_;
        mutable std::shared_mutex         mutex_;
        std::set<std::string>             followed_;
    };

    class FederationIndex
    {
    public:
        static constexpr std::string_view ENTRY_PREFIX    = "/index/entry/";
        static constexpr std::string_view FOLLOWED_PREFIX = "/index/followed/";
        static constexpr size_t           DEFAULT_LIMIT   = 50;

        enum class Error
        {
            UNAUTHORIZED = 1,
            INVALID_ENTRY,
            ENTRY_NOT_FOUND,
        };

        /**
         * @brief Create the index owned by @param owner
         * @param db storage of entries and of the follow list
         * @param external optional access control collaborator consulted after the follow list
         */
        static std::shared_ptr<FederationIndex> New( std::shared_ptr<storage::KeyValueStore> db,
                                                     std::string                             owner,
                                                     std::shared_ptr<AccessController>       external = nullptr );

        /**
         * @brief Deterministic id of the entry pointing at @param contentLocator published by @param sourceSiteId
         */
        static std::string MakeEntryId( const std::string &sourceSiteId, const std::string &contentLocator );

        /**
         * @brief Build an entry from a federated content item
         * @param item content, its metadata JSON feeds type, description and tags
         * @param sourceSiteId origin of the content
         * @param sourceSiteName display name of the origin
         */
        static FederationIndexEntry EntryFromContent( const ContentItem &item,
                                                      const std::string &sourceSiteId,
                                                      const std::string &sourceSiteName );

        /**
         * @brief Reload the persisted follow list into the write policy
         */
        outcome::result<void> Load();

        outcome::result<void> Insert( FederationIndexEntry entry, const std::string &actor );
        outcome::result<void> Remove( const std::string &id, const std::string &actor );

        outcome::result<FederationIndexEntry> Get( const std::string &id ) const;
        bool                                  Has( const std::string &id ) const;

        outcome::result<void> AddFollowedSite( const std::string &address );
        outcome::result<void> RemoveFollowedSite( const std::string &address );
        std::vector<std::string> GetFollowedSites() const;

        bool CanWrite( const std::string &actor ) const;

        std::vector<FederationIndexEntry> Search( const std::string &text, IndexQuery options = {} ) const;
        std::vector<FederationIndexEntry> GetByCategory( const std::string &categoryId, size_t limit = DEFAULT_LIMIT ) const;
        std::vector<FederationIndexEntry> GetByTags( const std::vector<std::string> &tags, size_t limit = DEFAULT_LIMIT ) const;
        std::vector<FederationIndexEntry> GetBySite( const std::string &sourceSiteId, size_t limit = DEFAULT_LIMIT ) const;
        std::vector<FederationIndexEntry> GetByType( const std::string &contentType, size_t limit = DEFAULT_LIMIT ) const;
        std::vector<FederationIndexEntry> GetByTimeRange( base::TimestampMs after,
                                                          base::TimestampMs before,
                                                          size_t            limit = DEFAULT_LIMIT ) const;
        std::vector<FederationIndexEntry> GetRecent( size_t limit = DEFAULT_LIMIT, size_t offset = 0 ) const;
        std::vector<FederationIndexEntry> GetFeatured( std::optional<base::TimestampMs> now = std::nullopt,
                                                       size_t limit = DEFAULT_LIMIT ) const;
        std::vector<FederationIndexEntry> GetPromoted( std::optional<base::TimestampMs> now = std::nullopt,
                                                       size_t limit = DEFAULT_LIMIT ) const;
        std::vector<FederationIndexEntry> ComplexQuery( const IndexQuery &query ) const;

        /**
         * @brief Every entry, empty if the store cannot be read
         */
        std::vector<FederationIndexEntry> GetAllEntries() const;

        IndexStats GetStats() const;

        const std::string &GetOwner() const
        {
            return policy_->GetOwner();
        }

    private:
        FederationIndex( std::shared_ptr<storage::KeyValueStore> db, std::shared_ptr<FollowListAccessPolicy> policy );

        static bool Matches( const FederationIndexEntry &entry, const IndexQuery &query, base::TimestampMs now );

        std::shared_ptr<storage::KeyValueStore> db_;
        std::shared_ptr<FollowListAccessPolicy> policy_;

        base::Logger m_logger = base::createLogger( "FederationIndex" );
    };
} // namespace fedsync::federation

OUTCOME_HPP_DECLARE_ERROR_2( fedsync::federation, FederationIndex::Error );

#endif // FEDSYNC_FEDERATION_INDEX_HPP
