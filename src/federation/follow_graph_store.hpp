/**
 * @file       follow_graph_store.hpp
 * @brief      Persisted outgoing follow edges of the local site
 */
#ifndef FEDSYNC_FOLLOW_GRAPH_STORE_HPP
#define FEDSYNC_FOLLOW_GRAPH_STORE_HPP

#include <map>
#include <optional>
#include <shared_mutex>

#include "base/logger.hpp"
#include "federation/federation_types.hpp"
#include "storage/key_value_store.hpp"

namespace fedsync::federation
{
    /**
     * @brief Directed edges from the local site to the sites it follows.
     * Every mutation is written through to the key value store under /follow/<id>.
     */
    class FollowGraphStore
    {
    public:
        static constexpr std::string_view EDGE_PREFIX = "/follow/";

        enum class Error
        {
            SELF_FOLLOW = 1,
            EMPTY_TARGET,
            ALREADY_FOLLOWING,
            EDGE_NOT_FOUND,
        };

        /**
         * @brief Create the store of @param localAddress backed by @param db
         * @return nullptr if @param db is null or @param localAddress is empty
         */
        static std::shared_ptr<FollowGraphStore> New( std::shared_ptr<storage::KeyValueStore> db,
                                                      std::string                             localAddress );

        /**
         * @brief Rebuild the in memory view from persisted records
         * @return number of edges loaded
         */
        outcome::result<size_t> Load();

        /**
         * @brief Create and persist an edge to @param targetAddress
         * @param displayName name shown for the followed site, the address when empty
         * @param recursive import content the target federated from elsewhere too
         * @param followChain intermediaries the edge was discovered through
         * @return the new edge, or SELF_FOLLOW / EMPTY_TARGET / ALREADY_FOLLOWING
         */
        outcome::result<FollowEdge> AddEdge( const std::string       &targetAddress,
                                             const std::string       &displayName,
                                             bool                     recursive,
                                             std::vector<std::string> followChain = {} );

        /**
         * @brief Delete an edge
         * @return the removed edge or EDGE_NOT_FOUND
         */
        outcome::result<FollowEdge> RemoveEdge( const std::string &id );

        outcome::result<FollowEdge> GetEdge( const std::string &id ) const;

        std::optional<FollowEdge> FindByTarget( const std::string &targetAddress ) const;

        bool IsFollowing( const std::string &targetAddress ) const;

        std::vector<FollowEdge> GetEdges() const;

        const std::string &GetLocalAddress() const
        {
            return localAddress_;
        }

    private:
        FollowGraphStore( std::shared_ptr<storage::KeyValueStore> db, std::string localAddress );

        static std::string KeyFor( const std::string &id );

        std::shared_ptr<storage::KeyValueStore> db_;
        std::string                             localAddress_;

        mutable std::shared_mutex         mutex_;
        std::map<std::string, FollowEdge> edges_;

        base::Logger m_logger = base::createLogger( "FollowGraphStore" );
    };
} // namespace fedsync::federation

OUTCOME_HPP_DECLARE_ERROR_2( fedsync::federation, FollowGraphStore::Error );

#endif // FEDSYNC_FOLLOW_GRAPH_STORE_HPP
