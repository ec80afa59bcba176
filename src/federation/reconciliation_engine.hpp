/**
 * @file       reconciliation_engine.hpp
 * @brief      Decides which remote changes land in the local site
 */
#ifndef FEDSYNC_RECONCILIATION_ENGINE_HPP
#define FEDSYNC_RECONCILIATION_ENGINE_HPP

#include <functional>
#include <memory>

#include "base/logger.hpp"
#include "base/util.hpp"
#include "content/content_store.hpp"
#include "federation/federation_index.hpp"
#include "federation/federation_types.hpp"

namespace fedsync::federation
{
    /**
     * @brief Transport agnostic import/evict logic. Imports go to the full
     * content store, or to the federation index when the local site has one.
     * Every operation is idempotent: replaying a batch leaves the store as is.
     */
    class ReconciliationEngine
    {
    public:
        using Clock = std::function<base::TimestampMs()>;

        static constexpr size_t DEFAULT_BATCH_SIZE = 20;

        /**
         * @brief Create an engine importing on behalf of @param localAddress
         * @param store local content collection
         * @param index optional federation index; when set, pointers are imported instead of content
         * @param batchSize items reconciled concurrently
         * @return nullptr on missing store or address
         */
        static std::shared_ptr<ReconciliationEngine> New( std::string                            localAddress,
                                                          std::shared_ptr<content::ContentStore> store,
                                                          std::shared_ptr<FederationIndex>       index     = nullptr,
                                                          size_t batchSize = DEFAULT_BATCH_SIZE );

        /**
         * @brief Apply a delivery of @param edge
         * @param added items present at the followed site
         * @param removed items deleted at the followed site
         * @param realtime whether the delivery came from a live stream
         * @return per outcome counters, failures are recorded and never abort the batch
         */
        ReconcileResult Reconcile( const FollowEdge               &edge,
                                   const std::vector<ContentItem> &added,
                                   const std::vector<ContentItem> &removed,
                                   bool                            realtime = false );

        /**
         * @brief Remove every local item (or index entry) federated from @param siteAddress
         * @return number of records removed
         */
        outcome::result<size_t> Purge( const std::string &siteAddress, size_t scanBatchSize );

        bool UsesFederationIndex() const
        {
            return index_ != nullptr;
        }

        void SetClock( Clock clock );

    private:
        enum class Decision
        {
            Imported,
            Evicted,
            Skipped,
        };

        ReconciliationEngine( std::string                            localAddress,
                              std::shared_ptr<content::ContentStore> store,
                              std::shared_ptr<FederationIndex>       index,
                              size_t                                 batchSize );

        ReconcileResult RunBatches( const std::vector<ContentItem>                              &items,
                                    const std::function<outcome::result<Decision>( const ContentItem & )> &apply );

        outcome::result<Decision> Import( const FollowEdge &edge, const ContentItem &item, bool realtime );
        outcome::result<Decision> Evict( const FollowEdge &edge, const ContentItem &item );

        outcome::result<Decision> ImportPointer( const FollowEdge  &edge,
                                                 const ContentItem &item,
                                                 const std::string &origin );
        outcome::result<Decision> EvictPointer( const FollowEdge &edge, const ContentItem &item );

        std::string                            localAddress_;
        std::shared_ptr<content::ContentStore> store_;
        std::shared_ptr<FederationIndex>       index_;
        size_t                                 batchSize_;
        Clock                                  clock_;

        base::Logger m_logger = base::createLogger( "ReconciliationEngine" );
    };
} // namespace fedsync::federation

#endif // FEDSYNC_RECONCILIATION_ENGINE_HPP
