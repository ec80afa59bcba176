#include "federation/transport/message_bus_transport.hpp"

#include <algorithm>

#include <boost/system/error_code.hpp>

#include "base/util.hpp"

namespace fedsync::federation
{
    std::shared_ptr<MessageBusTransport> MessageBusTransport::New( std::string                    localAddress,
                                                                   std::string                    localName,
                                                                   std::shared_ptr<SiteDirectory> directory,
                                                                   std::shared_ptr<MessageBus>    bus,
                                                                   const FederationOptions       &options )
    {
        if ( localAddress.empty() || !directory || !bus )
        {
            return nullptr;
        }
        return std::shared_ptr<MessageBusTransport>( new MessageBusTransport( std::move( localAddress ),
                                                                              std::move( localName ),
                                                                              std::move( directory ),
                                                                              std::move( bus ),
                                                                              options ) );
    }

    MessageBusTransport::MessageBusTransport( std::string                    localAddress,
                                              std::string                    localName,
                                              std::shared_ptr<SiteDirectory> directory,
                                              std::shared_ptr<MessageBus>    bus,
                                              const FederationOptions       &options ) :
        localAddress_( std::move( localAddress ) ),
        localName_( std::move( localName ) ),
        directory_( std::move( directory ) ),
        bus_( std::move( bus ) ),
        options_( options ),
        snapshotBackoff_( options.snapshotRetryBase,
                          options.snapshotRetryCap,
                          options.snapshotOpenAttempts,
                          options.snapshotRetryJitter )
    {
    }

    MessageBusTransport::~MessageBusTransport()
    {
        std::map<std::string, Following> following;
        {
            std::lock_guard lock( mutex_ );
            following.swap( following_ );
        }
        for ( auto &[edgeId, entry] : following )
        {
            Release( entry );
        }
    }

    std::string MessageBusTransport::TopicFor( const std::string &address )
    {
        return "fedsync/site/" + address + "/updates";
    }

    outcome::result<void> MessageBusTransport::Start( const FollowEdge &edge, std::chrono::milliseconds openTimeout )
    {
        Stop( edge.id() );

        std::string edge_id = edge.id();
        std::string site    = edge.target_address();
        OUTCOME_TRY( ( auto &&, subscription ),
                     bus_->Subscribe( TopicFor( site ),
                                      [weak_instance = weak_from_this(), edge_id, site]( const std::vector<uint8_t> &data )
                                      {
                                          if ( auto instance = weak_instance.lock() )
                                          {
                                              instance->OnMessage( edge_id, site, data );
                                          }
                                      } ) );

        auto wait_timeout = std::min( openTimeout, options_.subscriptionWaitTimeout );
        if ( !bus_->WaitForSubscription( subscription, wait_timeout ) )
        {
            m_logger->warn( "Subscription to {} not established within {} ms, continuing",
                            TopicFor( site ),
                            wait_timeout.count() );
        }

        Following entry;
        entry.address        = site;
        entry.subscription   = subscription;
        entry.historicalSync = std::make_unique<std::thread>( [this, edge, token = entry.token]
                                                              { HistoricalSync( edge, token ); } );

        std::lock_guard lock( mutex_ );
        following_.emplace( edge.id(), std::move( entry ) );
        m_logger->info( "Subscribed to {} for edge {}", TopicFor( site ), edge.id() );
        return outcome::success();
    }

    void MessageBusTransport::Stop( const std::string &edgeId )
    {
        Following entry;
        {
            std::lock_guard lock( mutex_ );
            auto            it = following_.find( edgeId );
            if ( it == following_.end() )
            {
                return;
            }
            entry = std::move( it->second );
            following_.erase( it );
        }
        Release( entry );
        m_logger->debug( "Stopped following for edge {}", edgeId );
    }

    void MessageBusTransport::Release( Following &following )
    {
        following.token.Cancel();
        bus_->Unsubscribe( following.subscription );
        if ( following.historicalSync && following.historicalSync->joinable() )
        {
            following.historicalSync->join();
        }
        following.historicalSync.reset();
    }

    void MessageBusTransport::HistoricalSync( FollowEdge edge, CancellationToken token )
    {
        auto start = std::chrono::steady_clock::now();
        auto poll  = options_.historicalSyncPollInterval;

        content::ContentQuery query;
        query.filter = [&edge]( const ContentItem &item ) { return PassesRecursionRule( edge, item ); };

        while ( !token.IsCancelled() && std::chrono::steady_clock::now() - start < options_.historicalSyncWindow )
        {
            auto maybe_store = directory_->Open( edge.target_address(), SiteDirectory::OpenMode::Observe, poll );
            if ( maybe_store.has_value() )
            {
                auto maybe_items = maybe_store.value()->Search( query );
                directory_->Close( edge.target_address(), SiteDirectory::OpenMode::Observe );
                if ( maybe_items.has_value() )
                {
                    Deliver( edge.id(), std::move( maybe_items.value() ), false, false );
                }
                else
                {
                    m_logger->debug( "Head state of {} unreadable: {}",
                                     edge.target_address(),
                                     maybe_items.error().message() );
                }
            }
            else
            {
                m_logger->debug( "Head state of {} unavailable: {}",
                                 edge.target_address(),
                                 maybe_store.error().message() );
            }
            if ( !token.WaitFor( poll ) )
            {
                break;
            }
        }
        m_logger->debug( "Historical sync of edge {} finished", edge.id() );
    }

    void MessageBusTransport::OnMessage( const std::string          &edgeId,
                                         const std::string          &expectedSite,
                                         const std::vector<uint8_t> &data )
    {
        pb::SyncUpdate update;
        if ( !update.ParseFromArray( data.data(), static_cast<int>( data.size() ) ) )
        {
            m_logger->warn( "Dropping malformed update on {}", TopicFor( expectedSite ) );
            return;
        }
        if ( update.site_id() != expectedSite )
        {
            m_logger->warn( "Dropping update of {} received on {}", update.site_id(), TopicFor( expectedSite ) );
            return;
        }
        m_logger->debug( "Update from {}: {} added, {} removed",
                         update.site_id(),
                         update.added_size(),
                         update.removed_size() );

        Deliver( edgeId, std::vector<ContentItem>( update.added().begin(), update.added().end() ), false, true );
        Deliver( edgeId, std::vector<ContentItem>( update.removed().begin(), update.removed().end() ), true, true );
    }

    outcome::result<void> MessageBusTransport::PublishLocalChanges( const std::vector<ContentItem> &added,
                                                                    const std::vector<ContentItem> &removed )
    {
        if ( added.empty() && removed.empty() )
        {
            return outcome::success();
        }
        auto topic = TopicFor( localAddress_ );

        if ( bus_->SubscriberCount( topic ) == 0 )
        {
            bus_->RequestSubscribers( topic );
            bool found = base::waitForCondition( [this, &topic] { return bus_->SubscriberCount( topic ) > 0; },
                                                 options_.subscriberDiscoveryTimeout,
                                                 nullptr,
                                                 options_.subscriberPollInterval );
            if ( !found )
            {
                m_logger->warn( "No subscribers found on {}, publishing anyway", topic );
            }
        }

        pb::SyncUpdate update;
        update.set_site_id( localAddress_ );
        if ( !localName_.empty() )
        {
            update.set_site_name( localName_ );
        }
        for ( const auto &item : added )
        {
            *update.add_added() = item;
        }
        for ( const auto &item : removed )
        {
            *update.add_removed() = item;
        }
        update.set_timestamp( base::NowMillis() );

        std::vector<uint8_t> data( update.ByteSizeLong() );
        if ( !update.SerializeToArray( data.data(), static_cast<int>( data.size() ) ) )
        {
            return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::invalid_argument ) );
        }
        BOOST_OUTCOME_TRYV2( auto &&, bus_->Publish( topic, std::move( data ) ) );
        m_logger->debug( "Published {} added, {} removed on {}", added.size(), removed.size(), topic );
        return outcome::success();
    }

    outcome::result<std::vector<ContentItem>> MessageBusTransport::Snapshot( const FollowEdge &edge, size_t limit )
    {
        // Stopping the edge also stops the retries
        CancellationToken token;
        {
            std::lock_guard lock( mutex_ );
            auto            it = following_.find( edge.id() );
            if ( it != following_.end() )
            {
                token = it->second.token;
            }
        }
        OUTCOME_TRY( ( auto &&, store ),
                     directory_->OpenWithRetry( edge.target_address(),
                                                SiteDirectory::OpenMode::Observe,
                                                options_.snapshotOpenTimeout,
                                                snapshotBackoff_,
                                                token ) );

        content::ContentQuery query;
        query.filter = [edge]( const ContentItem &item ) { return PassesRecursionRule( edge, item ); };
        query.limit  = limit;
        auto items   = store->Search( query );
        directory_->Close( edge.target_address(), SiteDirectory::OpenMode::Observe );
        return items;
    }
} // namespace fedsync::federation
