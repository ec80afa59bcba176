#ifndef FEDSYNC_TESTUTIL_DELIVERY_RECORDER_HPP
#define FEDSYNC_TESTUTIL_DELIVERY_RECORDER_HPP

#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "federation/transport/transport.hpp"

namespace fedsync::test
{
    /**
     * @brief Collects what a transport hands to its delivery handler
     */
    class DeliveryRecorder
    {
    public:
        struct Delivery
        {
            std::string                          edgeId;
            std::vector<federation::ContentItem> items;
            bool                                 isRemoval;
            bool                                 realtime;
        };

        federation::Transport::DeliveryHandler Handler()
        {
            return [this]( const std::string &edgeId, std::vector<federation::ContentItem> items, bool isRemoval, bool realtime )
            {
                std::lock_guard lock( mutex_ );
                deliveries_.push_back( { edgeId, std::move( items ), isRemoval, realtime } );
            };
        }

        std::vector<Delivery> Deliveries() const
        {
            std::lock_guard lock( mutex_ );
            return deliveries_;
        }

        /// Ids of every item delivered as added (or removed) so far
        std::set<std::string> Ids( bool removals = false ) const
        {
            std::lock_guard       lock( mutex_ );
            std::set<std::string> ids;
            for ( const auto &delivery : deliveries_ )
            {
                if ( delivery.isRemoval == removals )
                {
                    for ( const auto &item : delivery.items )
                    {
                        ids.insert( item.id() );
                    }
                }
            }
            return ids;
        }

        bool Contains( const std::string &id, bool removal = false ) const
        {
            return Ids( removal ).count( id ) != 0;
        }

        size_t Count() const
        {
            std::lock_guard lock( mutex_ );
            return deliveries_.size();
        }

    private:
        mutable std::mutex    mutex_;
        std::vector<Delivery> deliveries_;
    };
} // namespace fedsync::test

#endif // FEDSYNC_TESTUTIL_DELIVERY_RECORDER_HPP
