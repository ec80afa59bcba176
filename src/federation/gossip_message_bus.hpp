/**
 * @file       gossip_message_bus.hpp
 * @brief      MessageBus over libp2p gossip pub/sub
 */
#ifndef FEDSYNC_GOSSIP_MESSAGE_BUS_HPP
#define FEDSYNC_GOSSIP_MESSAGE_BUS_HPP

#include <future>
#include <map>
#include <mutex>
#include <vector>

#include <ipfs_pubsub/gossip_pubsub.hpp>

#include "base/logger.hpp"
#include "base/util.hpp"
#include "federation/message_bus.hpp"

namespace fedsync::federation
{
    /**
     * @brief Gossip backed bus. Gossip does not expose who listens on a
     * topic, so every subscriber announces itself on a companion
     * "<topic>/subscribers" topic, and discovery requests ask subscribers
     * to announce again besides providing the topic key on the DHT.
     * A peer that drops its last subscription of a topic sends a leave,
     * and announcements older than the presence TTL no longer count.
     */
    class GossipMessageBus : public MessageBus, public std::enable_shared_from_this<GossipMessageBus>
    {
    public:
        using GossipPubSub = sgns::ipfs_pubsub::GossipPubSub;

        static constexpr std::string_view PRESENCE_SUFFIX = "/subscribers";

        /// Lifetime of an announcement that was not refreshed
        static constexpr std::chrono::milliseconds PRESENCE_TTL{ 5 * 60 * 1000 };

        ~GossipMessageBus() override;

        /**
         * @brief Factory method to create a bus on a started pub/sub instance
         * @param pubSub gossip pub/sub, already started
         * @param presenceTtl how long a remote announcement counts as a subscriber
         * @return nullptr if @param pubSub is null
         */
        static std::shared_ptr<GossipMessageBus> New( std::shared_ptr<GossipPubSub> pubSub,
                                                      std::chrono::milliseconds     presenceTtl = PRESENCE_TTL );

        outcome::result<void> Publish( const std::string &topic, std::vector<uint8_t> data ) override;

        outcome::result<SubscriptionId> Subscribe( const std::string &topic, Handler handler ) override;

        void Unsubscribe( SubscriptionId id ) override;

        bool WaitForSubscription( SubscriptionId id, std::chrono::milliseconds timeout ) override;

        size_t SubscriberCount( const std::string &topic ) override;

        void RequestSubscribers( const std::string &topic ) override;

    private:
        using SubscriptionFuture = std::future<libp2p::protocol::Subscription>;

        GossipMessageBus( std::shared_ptr<GossipPubSub> pubSub, std::chrono::milliseconds presenceTtl );

        struct Subscription
        {
            std::string        topic;
            SubscriptionFuture future;
        };

        void SendPresence( const std::string &topic, int kind );
        void WatchPresence( const std::string &topic );
        void OnPresence( boost::optional<const GossipPubSub::Message &> message, const std::string &topic );
        bool IsSubscribed( const std::string &topic );
        bool IsActive( SubscriptionId id );

        /**
         * @brief Cancel the gossip subscription behind @param future
         * @return false if the subscription is not established yet and could not be cancelled
         */
        static bool Cancel( SubscriptionFuture &future );

        /** Cancel the pending subscriptions that got established since. Requires subscriptionMutex_. */
        void SweepPending();

        std::shared_ptr<GossipPubSub> pubSub_;
        std::string                   peerId_;
        std::chrono::milliseconds     presenceTtl_;

        std::mutex                             subscriptionMutex_; ///< protects subscriptions_ and pending_
        std::map<SubscriptionId, Subscription> subscriptions_;
        std::vector<SubscriptionFuture>        pending_;           ///< unsubscribed before being established
        SubscriptionId                         nextId_ = 1;

        std::mutex                                                        presenceMutex_; ///< protects presence_ and watchers_
        std::map<std::string, std::map<std::string, base::TimestampMs>> presence_;      ///< topic -> peer -> last announce
        std::map<std::string, SubscriptionFuture>                         watchers_;

        base::Logger m_logger = base::createLogger( "GossipMessageBus" );
    };
} // namespace fedsync::federation

#endif // FEDSYNC_GOSSIP_MESSAGE_BUS_HPP
