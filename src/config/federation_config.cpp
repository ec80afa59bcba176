#include "config/federation_config.hpp"

#include <fstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "base/logger.hpp"
#include "config/pt_util.hpp"

namespace fedsync::config
{
    namespace
    {
        using boost::property_tree::ptree;

        void ReadMillis( const ptree &tree, const char *key, std::chrono::milliseconds &target )
        {
            if ( auto value = tree.get_optional<int64_t>( key ) )
            {
                target = std::chrono::milliseconds( *value );
            }
        }

        template <typename T>
        void ReadValue( const ptree &tree, const char *key, T &target )
        {
            if ( auto value = tree.get_optional<T>( key ) )
            {
                target = *value;
            }
        }

        void ReadOptions( const ptree &tree, federation::FederationOptions &options )
        {
            ReadValue( tree, "reconcile_batch_size", options.reconcileBatchSize );
            ReadValue( tree, "initial_sync_limit", options.initialSyncLimit );
            ReadValue( tree, "scan_batch_size", options.scanBatchSize );
            ReadValue( tree, "max_connect_attempts", options.maxConnectAttempts );
            ReadValue( tree, "max_reconnect_attempts", options.maxReconnectAttempts );
            ReadValue( tree, "snapshot_open_attempts", options.snapshotOpenAttempts );
            ReadValue( tree, "snapshot_retry_jitter", options.snapshotRetryJitter );

            ReadMillis( tree, "open_timeout_ms", options.openTimeout );
            ReadMillis( tree, "min_open_timeout_ms", options.minOpenTimeout );
            ReadMillis( tree, "background_retry_interval_ms", options.backgroundRetryInterval );
            ReadMillis( tree, "health_check_interval_ms", options.healthCheckInterval );
            ReadMillis( tree, "max_idle_ms", options.maxIdle );
            ReadMillis( tree, "historical_sync_window_ms", options.historicalSyncWindow );
            ReadMillis( tree, "historical_sync_poll_interval_ms", options.historicalSyncPollInterval );
            ReadMillis( tree, "subscriber_discovery_timeout_ms", options.subscriberDiscoveryTimeout );
            ReadMillis( tree, "subscription_wait_timeout_ms", options.subscriptionWaitTimeout );
            ReadMillis( tree, "snapshot_open_timeout_ms", options.snapshotOpenTimeout );
        }

        outcome::result<NodeConfig> ReadNodeConfig( const ptree &tree, const base::Logger &logger )
        {
            NodeConfig config;
            OUTCOME_TRY( ( auto &&, address ), ensure( tree.get_optional<std::string>( "address" ) ) );
            if ( address.empty() )
            {
                return ConfigReaderError::MISSING_ENTRY;
            }
            config.address     = address;
            config.name        = tree.get<std::string>( "name", address );
            config.storagePath = tree.get<std::string>( "storage.path", "" );
            config.logLevel    = tree.get<std::string>( "log_level", config.logLevel );

            auto transport_name = tree.get<std::string>( "transport", "realtime" );
            auto transport      = federation::ParseTransportKind( transport_name );
            if ( !transport )
            {
                logger->error( "Unknown transport {}", transport_name );
                return ConfigReaderError::INVALID_ENTRY;
            }
            config.options.transport          = *transport;
            config.options.useFederationIndex = tree.get<bool>( "use_federation_index", false );

            if ( auto pubsub = tree.get_child_optional( "pubsub" ) )
            {
                config.pubsubPort = pubsub->get<uint16_t>( "port", 0 );
                if ( auto bootstrap = pubsub->get_child_optional( "bootstrap" ) )
                {
                    for ( const auto &peer : *bootstrap )
                    {
                        config.pubsubBootstrap.push_back( peer.second.get_value<std::string>() );
                    }
                }
            }

            if ( auto federation = tree.get_child_optional( "federation" ) )
            {
                ReadOptions( *federation, config.options );
            }
            OUTCOME_TRY( ( auto &&, verified ), config.options.Verify() );
            if ( verified != federation::FederationOptions::VerifyErrorCode::Success )
            {
                logger->error( "Inconsistent federation options ({})", static_cast<int>( verified ) );
                return ConfigReaderError::INVALID_ENTRY;
            }
            return config;
        }
    }

    outcome::result<NodeConfig> LoadFederationConfig( const std::string &path )
    {
        std::ifstream input( path );
        if ( !input.is_open() )
        {
            base::createLogger( "Config" )->error( "Cannot open configuration file {}", path );
            return ConfigReaderError::PARSER_ERROR;
        }
        return ParseFederationConfig( input );
    }

    outcome::result<void> CheckStandaloneNode( const NodeConfig &config )
    {
        auto logger = base::createLogger( "Config" );
        if ( config.options.transport != federation::TransportKind::MessageBus )
        {
            logger->error( "Transport {} needs the followed sites in the same process, use message-bus",
                           federation::ToString( config.options.transport ) );
            return ConfigReaderError::UNSUPPORTED_ENTRY;
        }
        if ( config.pubsubPort == 0 )
        {
            logger->error( "Transport message-bus needs pubsub.port" );
            return ConfigReaderError::UNSUPPORTED_ENTRY;
        }
        return outcome::success();
    }

    outcome::result<NodeConfig> ParseFederationConfig( std::istream &input )
    {
        auto  logger = base::createLogger( "Config" );
        ptree tree;
        try
        {
            boost::property_tree::read_json( input, tree );
            return ReadNodeConfig( tree, logger );
        }
        catch ( const boost::property_tree::json_parser_error &e )
        {
            logger->error( "Malformed configuration: {}", e.what() );
            return ConfigReaderError::PARSER_ERROR;
        }
        catch ( const boost::property_tree::ptree_bad_data &e )
        {
            logger->error( "Invalid configuration value: {}", e.what() );
            return ConfigReaderError::INVALID_ENTRY;
        }
    }
} // namespace fedsync::config
