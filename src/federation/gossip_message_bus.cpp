#include "federation/gossip_message_bus.hpp"

#include <algorithm>

#include <boost/system/error_code.hpp>
#include <libp2p/protocol/kademlia/content_id.hpp>

#include "crypto/sha/sha256.hpp"
#include "federation/proto/federation.pb.h"

namespace fedsync::federation
{
    namespace
    {
        constexpr std::chrono::milliseconds SETTLE_TIMEOUT{ 500 };

        std::vector<uint8_t> Encode( const google::protobuf::MessageLite &message )
        {
            std::vector<uint8_t> data( message.ByteSizeLong() );
            message.SerializeToArray( data.data(), static_cast<int>( data.size() ) );
            return data;
        }
    }

    std::shared_ptr<GossipMessageBus> GossipMessageBus::New( std::shared_ptr<GossipPubSub> pubSub,
                                                             std::chrono::milliseconds     presenceTtl )
    {
        if ( !pubSub )
        {
            return nullptr;
        }
        return std::shared_ptr<GossipMessageBus>( new GossipMessageBus( std::move( pubSub ), presenceTtl ) );
    }

    GossipMessageBus::GossipMessageBus( std::shared_ptr<GossipPubSub> pubSub, std::chrono::milliseconds presenceTtl ) :
        pubSub_( std::move( pubSub ) ),
        peerId_( pubSub_->GetHost()->getId().toBase58() ),
        presenceTtl_( presenceTtl )
    {
        m_logger->trace( "Initializing GossipMessageBus for peer {}", peerId_ );
    }

    GossipMessageBus::~GossipMessageBus()
    {
        std::vector<SubscriptionFuture> futures;
        {
            std::lock_guard lock( subscriptionMutex_ );
            for ( auto &entry : subscriptions_ )
            {
                futures.push_back( std::move( entry.second.future ) );
            }
            subscriptions_.clear();
            for ( auto &future : pending_ )
            {
                futures.push_back( std::move( future ) );
            }
            pending_.clear();
        }
        {
            std::lock_guard lock( presenceMutex_ );
            for ( auto &entry : watchers_ )
            {
                futures.push_back( std::move( entry.second ) );
            }
            watchers_.clear();
        }
        for ( auto &future : futures )
        {
            // In-flight subscriptions get a bounded wait so they can still be cancelled
            if ( future.valid() && future.wait_for( SETTLE_TIMEOUT ) == std::future_status::ready )
            {
                future.get().cancel();
            }
        }
        m_logger->debug( "~GossipMessageBus CALLED" );
    }

    outcome::result<void> GossipMessageBus::Publish( const std::string &topic, std::vector<uint8_t> data )
    {
        if ( topic.empty() )
        {
            return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::invalid_argument ) );
        }
        pubSub_->Publish( topic, data );
        m_logger->debug( "Published {} bytes to topic {}", data.size(), topic );
        return outcome::success();
    }

    outcome::result<MessageBus::SubscriptionId> GossipMessageBus::Subscribe( const std::string &topic, Handler handler )
    {
        if ( topic.empty() || !handler )
        {
            return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::invalid_argument ) );
        }
        m_logger->debug( "Subscription request sent to topic: {}", topic );

        SubscriptionId id;
        {
            std::lock_guard lock( subscriptionMutex_ );
            SweepPending();
            id = nextId_++;
        }

        SubscriptionFuture future = pubSub_->Subscribe(
            topic,
            [weakptr = weak_from_this(), id, topic, handler = std::move( handler )](
                boost::optional<const GossipPubSub::Message &> message )
            {
                if ( auto self = weakptr.lock() )
                {
                    if ( !message || !self->IsActive( id ) )
                    {
                        return;
                    }
                    self->m_logger->trace( "Message received on topic: {}", topic );
                    handler( message->data );
                }
            } );

        {
            std::lock_guard lock( subscriptionMutex_ );
            subscriptions_.emplace( id, Subscription{ topic, std::move( future ) } );
        }

        WatchPresence( topic );
        SendPresence( topic, pb::SubscriberPresence::ANNOUNCE );
        return id;
    }

    bool GossipMessageBus::Cancel( SubscriptionFuture &future )
    {
        if ( !future.valid() )
        {
            return true;
        }
        if ( future.wait_for( std::chrono::seconds( 0 ) ) != std::future_status::ready )
        {
            return false;
        }
        future.get().cancel();
        return true;
    }

    void GossipMessageBus::SweepPending()
    {
        pending_.erase( std::remove_if( pending_.begin(),
                                        pending_.end(),
                                        []( SubscriptionFuture &future ) { return Cancel( future ); } ),
                        pending_.end() );
    }

    bool GossipMessageBus::IsActive( SubscriptionId id )
    {
        std::lock_guard lock( subscriptionMutex_ );
        return subscriptions_.count( id ) != 0;
    }

    void GossipMessageBus::Unsubscribe( SubscriptionId id )
    {
        std::string topic;
        {
            std::lock_guard lock( subscriptionMutex_ );
            SweepPending();
            auto it = subscriptions_.find( id );
            if ( it == subscriptions_.end() )
            {
                return;
            }
            topic = it->second.topic;
            if ( !Cancel( it->second.future ) )
            {
                // Cancelled by a later sweep, the handler is muted meanwhile
                pending_.push_back( std::move( it->second.future ) );
            }
            subscriptions_.erase( it );
        }
        m_logger->debug( "Unsubscribed from {}", topic );

        if ( !IsSubscribed( topic ) )
        {
            SendPresence( topic, pb::SubscriberPresence::LEAVE );
        }
    }

    bool GossipMessageBus::WaitForSubscription( SubscriptionId id, std::chrono::milliseconds timeout )
    {
        std::chrono::milliseconds waited{};
        bool                      established = base::waitForCondition(
            [this, id]()
            {
                std::lock_guard lock( subscriptionMutex_ );
                auto            it = subscriptions_.find( id );
                return it != subscriptions_.end() && it->second.future.valid() &&
                       it->second.future.wait_for( std::chrono::seconds( 0 ) ) == std::future_status::ready;
            },
            timeout,
            &waited );

        if ( established )
        {
            m_logger->debug( "Subscription established after {} ms", waited.count() );
        }
        else
        {
            m_logger->error( "Subscription not established within the specified time ({} ms)", timeout.count() );
        }
        return established;
    }

    size_t GossipMessageBus::SubscriberCount( const std::string &topic )
    {
        WatchPresence( topic );
        std::lock_guard lock( presenceMutex_ );
        auto            it = presence_.find( topic );
        if ( it == presence_.end() )
        {
            return 0;
        }
        const auto oldest = base::NowMillis() - presenceTtl_.count();
        for ( auto peer = it->second.begin(); peer != it->second.end(); )
        {
            if ( peer->second < oldest )
            {
                m_logger->debug( "Presence of peer {} on {} expired", peer->first, topic );
                peer = it->second.erase( peer );
            }
            else
            {
                ++peer;
            }
        }
        return it->second.size();
    }

    void GossipMessageBus::RequestSubscribers( const std::string &topic )
    {
        WatchPresence( topic );

        SendPresence( topic, pb::SubscriberPresence::QUERY );

        auto                                 hash = crypto::sha256( topic );
        std::vector<unsigned char>           key_bytes( hash.begin(), hash.end() );
        libp2p::protocol::kademlia::ContentId key( key_bytes );
        pubSub_->GetDHT()->Start();
        pubSub_->ProvideCID( key );
        pubSub_->StartFindingPeers( key );
        m_logger->debug( "Requested subscribers of {}", topic );
    }

    void GossipMessageBus::SendPresence( const std::string &topic, int kind )
    {
        pb::SubscriberPresence presence;
        presence.set_kind( static_cast<pb::SubscriberPresence::Kind>( kind ) );
        presence.set_peer_id( peerId_ );
        presence.set_topic( topic );
        pubSub_->Publish( topic + std::string( PRESENCE_SUFFIX ), Encode( presence ) );
    }

    void GossipMessageBus::WatchPresence( const std::string &topic )
    {
        std::lock_guard lock( presenceMutex_ );
        if ( watchers_.count( topic ) != 0 )
        {
            return;
        }
        auto future = pubSub_->Subscribe( topic + std::string( PRESENCE_SUFFIX ),
                                          [weakptr = weak_from_this(),
                                           topic]( boost::optional<const GossipPubSub::Message &> message )
                                          {
                                              if ( auto self = weakptr.lock() )
                                              {
                                                  self->OnPresence( message, topic );
                                              }
                                          } );
        watchers_.emplace( topic, std::move( future ) );
    }

    bool GossipMessageBus::IsSubscribed( const std::string &topic )
    {
        std::lock_guard lock( subscriptionMutex_ );
        for ( const auto &entry : subscriptions_ )
        {
            if ( entry.second.topic == topic )
            {
                return true;
            }
        }
        return false;
    }

    void GossipMessageBus::OnPresence( boost::optional<const GossipPubSub::Message &> message, const std::string &topic )
    {
        if ( !message )
        {
            return;
        }
        pb::SubscriberPresence presence;
        if ( !presence.ParseFromArray( message->data.data(), static_cast<int>( message->data.size() ) ) )
        {
            m_logger->warn( "Failed to parse SubscriberPresence on {}", topic );
            return;
        }
        if ( presence.topic() != topic || presence.peer_id() == peerId_ )
        {
            return;
        }

        switch ( presence.kind() )
        {
            case pb::SubscriberPresence::ANNOUNCE:
            {
                std::lock_guard lock( presenceMutex_ );
                if ( presence_[topic].insert_or_assign( presence.peer_id(), base::NowMillis() ).second )
                {
                    m_logger->debug( "Peer {} listens on {}", presence.peer_id(), topic );
                }
                break;
            }
            case pb::SubscriberPresence::LEAVE:
            {
                std::lock_guard lock( presenceMutex_ );
                if ( presence_[topic].erase( presence.peer_id() ) != 0 )
                {
                    m_logger->debug( "Peer {} left {}", presence.peer_id(), topic );
                }
                break;
            }
            case pb::SubscriberPresence::QUERY:
                if ( IsSubscribed( topic ) )
                {
                    SendPresence( topic, pb::SubscriberPresence::ANNOUNCE );
                }
                break;
            default:
                break;
        }
    }
} // namespace fedsync::federation
