/**
 * @file       message_bus_transport.hpp
 * @brief      Publish/subscribe propagation of site updates
 */
#ifndef FEDSYNC_MESSAGE_BUS_TRANSPORT_HPP
#define FEDSYNC_MESSAGE_BUS_TRANSPORT_HPP

#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "base/logger.hpp"
#include "federation/backoff.hpp"
#include "federation/federation_options.hpp"
#include "federation/message_bus.hpp"
#include "federation/site_directory.hpp"
#include "federation/transport/transport.hpp"

namespace fedsync::federation
{
    /**
     * @brief Every site publishes a SyncUpdate on its own topic whenever its
     * collection changes. Following a site subscribes to that topic and, for
     * a bounded window, also polls the site's head state so that content
     * published before the subscription is not missed.
     */
    class MessageBusTransport : public Transport, public std::enable_shared_from_this<MessageBusTransport>
    {
    public:
        static std::shared_ptr<MessageBusTransport> New( std::string                    localAddress,
                                                         std::string                    localName,
                                                         std::shared_ptr<SiteDirectory> directory,
                                                         std::shared_ptr<MessageBus>    bus,
                                                         const FederationOptions       &options );

        ~MessageBusTransport() override;

        /**
         * @brief Topic the site at @param address publishes its updates on
         */
        static std::string TopicFor( const std::string &address );

        TransportKind Kind() const override
        {
            return TransportKind::MessageBus;
        }

        outcome::result<void> Start( const FollowEdge &edge, std::chrono::milliseconds openTimeout ) override;
        void                  Stop( const std::string &edgeId ) override;

        outcome::result<std::vector<ContentItem>> Snapshot( const FollowEdge &edge, size_t limit ) override;

        /**
         * @brief Announce a change of the local collection to the followers.
         * Waits a bounded time for subscribers before publishing; publishes
         * anyway when none show up.
         */
        outcome::result<void> PublishLocalChanges( const std::vector<ContentItem> &added,
                                                   const std::vector<ContentItem> &removed );

    private:
        struct Following
        {
            std::string                 address;
            MessageBus::SubscriptionId  subscription = 0;
            CancellationToken           token;
            std::unique_ptr<std::thread> historicalSync;
        };

        MessageBusTransport( std::string                    localAddress,
                             std::string                    localName,
                             std::shared_ptr<SiteDirectory> directory,
                             std::shared_ptr<MessageBus>    bus,
                             const FederationOptions       &options );

        void OnMessage( const std::string &edgeId, const std::string &expectedSite, const std::vector<uint8_t> &data );

        void HistoricalSync( FollowEdge edge, CancellationToken token );

        void Release( Following &following );

        std::string                    localAddress_;
        std::string                    localName_;
        std::shared_ptr<SiteDirectory> directory_;
        std::shared_ptr<MessageBus>    bus_;
        FederationOptions              options_;
        Backoff                        snapshotBackoff_;

        std::mutex                       mutex_;
        std::map<std::string, Following> following_;

        base::Logger m_logger = base::createLogger( "MessageBusTransport" );
    };
} // namespace fedsync::federation

#endif // FEDSYNC_MESSAGE_BUS_TRANSPORT_HPP
