/**
 * @file       federation_service.hpp
 * @brief      Operator facing entry point of the federation engine
 */
#ifndef FEDSYNC_FEDERATION_SERVICE_HPP
#define FEDSYNC_FEDERATION_SERVICE_HPP

#include <memory>
#include <mutex>
#include <optional>

#include <boost/asio/io_context.hpp>

#include "base/logger.hpp"
#include "content/content_store.hpp"
#include "federation/access_controller.hpp"
#include "federation/federation_index.hpp"
#include "federation/federation_options.hpp"
#include "federation/follow_graph_store.hpp"
#include "federation/reconciliation_engine.hpp"
#include "federation/session_manager.hpp"
#include "federation/transport/transport_registry.hpp"
#include "storage/key_value_store.hpp"

namespace fedsync::federation
{
    /**
     * @brief Owns the follow graph, the reconciliation engine and the
     * sessions of one site. Follow edges added here are persisted and
     * survive restarts; Start() rebuilds their sessions.
     */
    class FederationService : public std::enable_shared_from_this<FederationService>
    {
    public:
        enum class Error
        {
            INDEX_DISABLED = 1,
            TRANSPORT_UNAVAILABLE,
            INVALID_OPTIONS,
        };

        /**
         * @brief Create the service of the site at @param localAddress
         * @param ctx io_context running the sessions
         * @param localName human readable name published with local updates
         * @param db storage of the follow graph and of the federation index
         * @param store local content collection
         * @param registry transports of this node
         * @param externalAccess optional access controller consulted after the index follow list
         */
        static outcome::result<std::shared_ptr<FederationService>> New(
            std::shared_ptr<boost::asio::io_context> ctx,
            std::string                              localAddress,
            std::string                              localName,
            std::shared_ptr<storage::KeyValueStore>  db,
            std::shared_ptr<content::ContentStore>   store,
            std::shared_ptr<TransportRegistry>       registry,
            const FederationOptions                 &options,
            std::shared_ptr<AccessController>        externalAccess = nullptr );

        ~FederationService();

        /**
         * @brief Load persisted edges and open their sessions
         */
        outcome::result<void> Start();

        /**
         * @brief Tear every session down. The follow graph is kept.
         */
        void Stop();

        /**
         * @brief Follow @param targetAddress
         * @param displayName shown for the site, the address when empty
         * @param recursive also import what the target federated from others
         */
        outcome::result<FollowEdge> AddFollowEdge( const std::string &targetAddress,
                                                   const std::string &displayName = "",
                                                   bool               recursive   = false );

        /**
         * @brief Unfollow
         * @param purge also remove every local item federated from the unfollowed site
         */
        outcome::result<void> RemoveFollowEdge( const std::string &edgeId, bool purge = false );

        std::vector<FollowEdge> GetFollowEdges() const;

        std::optional<SessionStatus>            GetSessionStatus( const std::string &edgeId ) const;
        std::vector<SessionManager::SessionInfo> GetSessions() const;

        /**
         * @brief Write rule of the local collection: local content follows the
         * local rules, federated puts require following the origin, federated
         * deletes are allowed.
         * @param origin provenance of the item, empty for local content
         */
        bool CanPerformFederatedWrite( const std::string &origin, bool isDelete ) const;

        /**
         * @brief CanPerformFederatedWrite as a ContentStore write policy
         */
        content::ContentStore::WritePolicy MakeWritePolicy();

        outcome::result<std::vector<FederationIndexEntry>> GetFederationIndexRecent( size_t limit  = 50,
                                                                                     size_t offset = 0 ) const;
        outcome::result<std::vector<FederationIndexEntry>> GetFederationIndexByCategory( const std::string &categoryId,
                                                                                         size_t limit = 50 ) const;
        outcome::result<std::vector<FederationIndexEntry>> SearchFederationIndex( const std::string &text ) const;
        outcome::result<std::vector<FederationIndexEntry>> ComplexFederationIndexQuery( const IndexQuery &query ) const;
        outcome::result<IndexStats>                        GetFederationIndexStats() const;

        std::shared_ptr<FederationIndex> GetFederationIndex() const
        {
            return index_;
        }

        const std::string &GetLocalAddress() const
        {
            return localAddress_;
        }

    private:
        FederationService( std::string                             localAddress,
                           std::shared_ptr<storage::KeyValueStore> db,
                           std::shared_ptr<content::ContentStore>  store,
                           const FederationOptions                &options );

        void OnLocalChange( const std::vector<ContentItem> &added, const std::vector<ContentItem> &removed );

        bool IsLocalOrigin( const std::string &origin ) const;

        outcome::result<std::shared_ptr<FederationIndex>> RequireIndex() const;

        std::shared_ptr<boost::asio::io_context> ctx_;
        std::string                              localAddress_;
        std::shared_ptr<storage::KeyValueStore>  db_;
        std::shared_ptr<content::ContentStore>   store_;
        FederationOptions                        options_;

        std::shared_ptr<TransportRegistry>    registry_;
        std::shared_ptr<Transport>            transport_;
        std::shared_ptr<FollowGraphStore>     graph_;
        std::shared_ptr<FederationIndex>      index_;
        std::shared_ptr<ReconciliationEngine> engine_;
        std::shared_ptr<SessionManager>       sessions_;

        std::mutex                                       lifecycleMutex_;
        bool                                             running_ = false;
        std::optional<content::ContentStore::ListenerId> localListener_;

        base::Logger m_logger = base::createLogger( "FederationService" );
    };
} // namespace fedsync::federation

OUTCOME_HPP_DECLARE_ERROR_2( fedsync::federation, FederationService::Error );

#endif // FEDSYNC_FEDERATION_SERVICE_HPP
