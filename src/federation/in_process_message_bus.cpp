#include "federation/in_process_message_bus.hpp"

#include <boost/system/error_code.hpp>

namespace fedsync::federation
{
    outcome::result<void> InProcessMessageBus::Publish( const std::string &topic, std::vector<uint8_t> data )
    {
        if ( topic.empty() )
        {
            return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::invalid_argument ) );
        }
        std::vector<Handler> handlers;
        {
            std::lock_guard lock( mutex_ );
            for ( const auto &entry : subscriptions_ )
            {
                if ( entry.second.topic == topic )
                {
                    handlers.push_back( entry.second.handler );
                }
            }
        }
        ++published_;
        for ( const auto &handler : handlers )
        {
            handler( data );
        }
        return outcome::success();
    }

    outcome::result<MessageBus::SubscriptionId> InProcessMessageBus::Subscribe( const std::string &topic,
                                                                                Handler            handler )
    {
        if ( topic.empty() || !handler )
        {
            return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::invalid_argument ) );
        }
        std::lock_guard lock( mutex_ );
        auto            id = nextId_++;
        subscriptions_.emplace( id, Subscription{ topic, std::move( handler ) } );
        return id;
    }

    void InProcessMessageBus::Unsubscribe( SubscriptionId id )
    {
        std::lock_guard lock( mutex_ );
        subscriptions_.erase( id );
    }

    bool InProcessMessageBus::WaitForSubscription( SubscriptionId id, std::chrono::milliseconds )
    {
        std::lock_guard lock( mutex_ );
        return subscriptions_.count( id ) != 0;
    }

    size_t InProcessMessageBus::SubscriberCount( const std::string &topic )
    {
        std::lock_guard lock( mutex_ );
        size_t          count = 0;
        for ( const auto &entry : subscriptions_ )
        {
            if ( entry.second.topic == topic )
            {
                ++count;
            }
        }
        return count;
    }

    void InProcessMessageBus::RequestSubscribers( const std::string & )
    {
        ++discoveryRequests_;
    }
} // namespace fedsync::federation
