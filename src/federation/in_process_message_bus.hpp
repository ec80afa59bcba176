#ifndef FEDSYNC_IN_PROCESS_MESSAGE_BUS_HPP
#define FEDSYNC_IN_PROCESS_MESSAGE_BUS_HPP

#include <atomic>
#include <map>
#include <mutex>

#include "federation/message_bus.hpp"

namespace fedsync::federation
{
    /**
     * @brief Loopback bus shared by the sites of one process. Publish hands
     * the payload to every handler of the topic on the caller's thread.
     */
    class InProcessMessageBus : public MessageBus
    {
    public:
        outcome::result<void> Publish( const std::string &topic, std::vector<uint8_t> data ) override;

        outcome::result<SubscriptionId> Subscribe( const std::string &topic, Handler handler ) override;

        void Unsubscribe( SubscriptionId id ) override;

        bool WaitForSubscription( SubscriptionId id, std::chrono::milliseconds timeout ) override;

        size_t SubscriberCount( const std::string &topic ) override;

        void RequestSubscribers( const std::string &topic ) override;

        /** Number of RequestSubscribers calls so far */
        size_t DiscoveryRequests() const
        {
            return discoveryRequests_.load();
        }

        /** Number of payloads published so far */
        size_t PublishedCount() const
        {
            return published_.load();
        }

    private:
        struct Subscription
        {
            std::string topic;
            Handler     handler;
        };

        mutable std::mutex                     mutex_;
        std::map<SubscriptionId, Subscription> subscriptions_;
        SubscriptionId                         nextId_ = 1;
        std::atomic<size_t>                    discoveryRequests_{ 0 };
        std::atomic<size_t>                    published_{ 0 };
    };
} // namespace fedsync::federation

#endif // FEDSYNC_IN_PROCESS_MESSAGE_BUS_HPP
