#ifndef FEDSYNC_MESSAGE_BUS_HPP
#define FEDSYNC_MESSAGE_BUS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "outcome/outcome.hpp"

namespace fedsync::federation
{
    /**
     * @brief A MessageBus provides a way to publish an opaque payload on a
     * topic to every subscribed peer, and to learn whether anyone listens.
     */
    class MessageBus
    {
    public:
        using Handler        = std::function<void( const std::vector<uint8_t> &data )>;
        using SubscriptionId = uint64_t;

        virtual ~MessageBus() = default;

        /**
         * Send @param data to the subscribers of @param topic
         * @return outcome::success on success or outcome::failure on error.
         */
        virtual outcome::result<void> Publish( const std::string &topic, std::vector<uint8_t> data ) = 0;

        /**
         * @brief Start receiving the messages of @param topic
         * @return id to wait on or cancel the subscription
         */
        virtual outcome::result<SubscriptionId> Subscribe( const std::string &topic, Handler handler ) = 0;

        /** Idempotent */
        virtual void Unsubscribe( SubscriptionId id ) = 0;

        /**
         * @brief Block until the subscription @param id is established on the network
         * @return false on timeout or unknown id
         */
        virtual bool WaitForSubscription( SubscriptionId id, std::chrono::milliseconds timeout ) = 0;

        /**
         * @brief Number of peers known to listen on @param topic
         */
        virtual size_t SubscriberCount( const std::string &topic ) = 0;

        /**
         * @brief Ask the network to reveal the subscribers of @param topic
         */
        virtual void RequestSubscribers( const std::string &topic ) = 0;
    };
} // namespace fedsync::federation

#endif // FEDSYNC_MESSAGE_BUS_HPP
