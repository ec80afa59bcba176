/**
 * @file       transport.hpp
 * @brief      Strategy interface for reaching a followed site
 */
#ifndef FEDSYNC_TRANSPORT_HPP
#define FEDSYNC_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "federation/federation_types.hpp"
#include "outcome/outcome.hpp"

namespace fedsync::federation
{
    /**
     * @brief A Transport discovers the content of followed sites and hands
     * it to a single delivery handler. One instance serves every edge of
     * the node, so all per edge state is keyed by edge id.
     */
    class Transport
    {
    public:
        /**
         * @param edgeId edge the items belong to
         * @param items content added at, or removed from, the followed site
         * @param isRemoval whether @param items were removed
         * @param realtime whether the items come from a live stream
         */
        using DeliveryHandler = std::function<
            void( const std::string &edgeId, std::vector<ContentItem> items, bool isRemoval, bool realtime )>;

        virtual ~Transport() = default;

        virtual TransportKind Kind() const = 0;

        const char *Name() const
        {
            return ToString( Kind() );
        }

        /**
         * @brief Open the session of @param edge
         * @param openTimeout bound of the connection attempt
         * @return failure if the followed site could not be reached in time
         */
        virtual outcome::result<void> Start( const FollowEdge &edge, std::chrono::milliseconds openTimeout ) = 0;

        /**
         * @brief Tear down the session of @param edgeId. Idempotent.
         */
        virtual void Stop( const std::string &edgeId ) = 0;

        /**
         * @brief Current content of the followed site under the edge's recursion rule
         * @param limit maximum number of items, 0 for all
         */
        virtual outcome::result<std::vector<ContentItem>> Snapshot( const FollowEdge &edge, size_t limit ) = 0;

        void SetDeliveryHandler( DeliveryHandler handler )
        {
            std::lock_guard lock( handlerMutex_ );
            handler_ = std::move( handler );
        }

    protected:
        void Deliver( const std::string &edgeId, std::vector<ContentItem> items, bool isRemoval, bool realtime )
        {
            if ( items.empty() )
            {
                return;
            }
            DeliveryHandler handler;
            {
                std::lock_guard lock( handlerMutex_ );
                handler = handler_;
            }
            if ( handler )
            {
                handler( edgeId, std::move( items ), isRemoval, realtime );
            }
        }

    private:
        std::mutex      handlerMutex_;
        DeliveryHandler handler_;
    };
} // namespace fedsync::federation

#endif // FEDSYNC_TRANSPORT_HPP
