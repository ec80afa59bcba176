#include "federation/transport/transport_registry.hpp"

#include "federation/transport/full_mirror_transport.hpp"
#include "federation/transport/realtime_transport.hpp"

namespace fedsync::federation
{
    TransportRegistry::TransportRegistry( std::string localAddress ) : localAddress_( std::move( localAddress ) ) {}

    std::shared_ptr<TransportRegistry> TransportRegistry::CreateDefault( const std::string             &localAddress,
                                                                         const std::string             &localName,
                                                                         std::shared_ptr<SiteDirectory> directory,
                                                                         std::shared_ptr<MessageBus>    bus,
                                                                         const FederationOptions       &options )
    {
        auto registry = std::make_shared<TransportRegistry>( localAddress );
        registry->Register( RealTimeTransport::New( directory, options ) );
        registry->Register( FullMirrorTransport::New( localAddress, directory, options ) );
        if ( bus )
        {
            registry->Register( MessageBusTransport::New( localAddress, localName, directory, bus, options ) );
        }
        return registry;
    }

    bool TransportRegistry::Register( std::shared_ptr<Transport> transport )
    {
        if ( !transport )
        {
            return false;
        }
        std::lock_guard lock( mutex_ );
        m_logger->debug( "Registered {} transport for {}", transport->Name(), localAddress_ );
        transports_[transport->Kind()] = std::move( transport );
        return true;
    }

    std::shared_ptr<Transport> TransportRegistry::Get( TransportKind kind ) const
    {
        std::lock_guard lock( mutex_ );
        auto            it = transports_.find( kind );
        if ( it == transports_.end() )
        {
            return nullptr;
        }
        return it->second;
    }

    std::shared_ptr<MessageBusTransport> TransportRegistry::GetMessageBusTransport() const
    {
        return std::dynamic_pointer_cast<MessageBusTransport>( Get( TransportKind::MessageBus ) );
    }
} // namespace fedsync::federation
