/**
 * @file       transport_registry.hpp
 * @brief      Transport instances owned by one node
 */
#ifndef FEDSYNC_TRANSPORT_REGISTRY_HPP
#define FEDSYNC_TRANSPORT_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "base/logger.hpp"
#include "federation/federation_options.hpp"
#include "federation/message_bus.hpp"
#include "federation/site_directory.hpp"
#include "federation/transport/message_bus_transport.hpp"
#include "federation/transport/transport.hpp"

namespace fedsync::federation
{
    /**
     * @brief Holds at most one transport per strategy for the node at
     * GetLocalAddress(). Built at node startup and handed to every session.
     */
    class TransportRegistry
    {
    public:
        explicit TransportRegistry( std::string localAddress );

        /**
         * @brief Build the registry of a node with every strategy it can run.
         * The message bus strategy is only registered when @param bus is set.
         */
        static std::shared_ptr<TransportRegistry> CreateDefault( const std::string             &localAddress,
                                                                 const std::string             &localName,
                                                                 std::shared_ptr<SiteDirectory> directory,
                                                                 std::shared_ptr<MessageBus>    bus,
                                                                 const FederationOptions       &options );

        /**
         * @brief Register @param transport, replacing any of the same kind
         * @return false if @param transport is null
         */
        bool Register( std::shared_ptr<Transport> transport );

        std::shared_ptr<Transport> Get( TransportKind kind ) const;

        /**
         * @brief The message bus strategy, used to publish local changes
         */
        std::shared_ptr<MessageBusTransport> GetMessageBusTransport() const;

        const std::string &GetLocalAddress() const
        {
            return localAddress_;
        }

    private:
        std::string                                         localAddress_;
        mutable std::mutex                                  mutex_;
        std::map<TransportKind, std::shared_ptr<Transport>> transports_;

        base::Logger m_logger = base::createLogger( "TransportRegistry" );
    };
} // namespace fedsync::federation

#endif // FEDSYNC_TRANSPORT_REGISTRY_HPP
