/**
 * @file       fedsync_node.cpp
 * @brief      Runs one federated site: storage, transports and follow sessions
 */
#include <algorithm>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include "base/logger.hpp"
#include "config/federation_config.hpp"
#include "content/kv_content_store.hpp"
#include "federation/federation_service.hpp"
#include "federation/gossip_message_bus.hpp"
#include "federation/site_directory.hpp"
#include "federation/transport/transport_registry.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace
{
    namespace po = boost::program_options;
    using namespace fedsync;

    outcome::result<std::shared_ptr<storage::KeyValueStore>> OpenStorage( const std::string &path )
    {
        if ( path.empty() )
        {
            return std::make_shared<storage::InMemoryStorage>();
        }
        storage::rocksdb::Options options;
        options.create_if_missing = true;
        OUTCOME_TRY( ( auto &&, db ), storage::rocksdb::create( path, options ) );
        return db;
    }

    std::shared_ptr<federation::MessageBus> OpenMessageBus( const config::NodeConfig &config, const base::Logger &logger )
    {
        auto pubsub  = std::make_shared<sgns::ipfs_pubsub::GossipPubSub>();
        auto started = pubsub->Start( config.pubsubPort, config.pubsubBootstrap );
        started.wait();
        logger->info( "Gossip pubsub listening on port {}", config.pubsubPort );
        return federation::GossipMessageBus::New( pubsub );
    }
}

int main( int argc, char **argv )
{
    po::options_description description( "Command line options" );
    // clang-format off
    description.add_options()
        ( "help", "Print out options" )
        ( "config", po::value<std::string>(), "Path of the node configuration JSON file" )
        ( "follow", po::value<std::vector<std::string>>()->multitoken(), "Addresses of sites to follow" )
        ( "recursive", "Follow the given sites recursively" )
        ( "threads", po::value<unsigned>()->default_value( 2 ), "Threads running the sessions" );
    // clang-format on

    po::variables_map vm;
    try
    {
        po::store( po::parse_command_line( argc, argv, description ), vm );
        po::notify( vm );
    }
    catch ( const po::error &err )
    {
        std::cerr << err.what() << std::endl;
        return 1;
    }
    if ( vm.count( "help" ) || !vm.count( "config" ) )
    {
        std::cout << description << std::endl;
        return vm.count( "help" ) ? 0 : 1;
    }

    auto logger      = base::createLogger( "FedSyncNode" );
    auto maybeConfig = config::LoadFederationConfig( vm["config"].as<std::string>() );
    if ( !maybeConfig )
    {
        logger->error( "Cannot load configuration: {}", maybeConfig.error().message() );
        return 1;
    }
    auto node = maybeConfig.value();
    if ( !base::setGlobalLevel( node.logLevel ) )
    {
        logger->warn( "Unknown log level {}", node.logLevel );
    }
    if ( auto supported = config::CheckStandaloneNode( node ); !supported )
    {
        logger->error( "Unsupported configuration: {}", supported.error().message() );
        return 1;
    }
    // Only this site is in the directory, followed sites arrive as live updates
    node.options.historicalSyncWindow = std::chrono::milliseconds( 0 );
    logger->warn( "Content published before a follow is not fetched, only live updates are federated" );

    auto maybeDb = OpenStorage( node.storagePath );
    if ( !maybeDb )
    {
        logger->error( "Cannot open storage at {}: {}", node.storagePath, maybeDb.error().message() );
        return 1;
    }
    auto db    = maybeDb.value();
    auto store = content::KvContentStore::New( db );

    auto directory = std::make_shared<federation::InProcessSiteDirectory>();
    directory->Register( node.address, store );

    auto registry = federation::TransportRegistry::CreateDefault( node.address,
                                                                  node.name,
                                                                  directory,
                                                                  OpenMessageBus( node, logger ),
                                                                  node.options );

    auto ctx          = std::make_shared<boost::asio::io_context>();
    auto maybeService = federation::FederationService::New( ctx, node.address, node.name, db, store, registry, node.options );
    if ( !maybeService )
    {
        logger->error( "Cannot create the federation service: {}", maybeService.error().message() );
        return 1;
    }
    auto service = maybeService.value();
    store->SetWritePolicy( service->MakeWritePolicy() );

    if ( auto started = service->Start(); !started )
    {
        logger->error( "Cannot start the federation service: {}", started.error().message() );
        return 1;
    }

    if ( vm.count( "follow" ) )
    {
        for ( const auto &address : vm["follow"].as<std::vector<std::string>>() )
        {
            auto edge = service->AddFollowEdge( address, "", vm.count( "recursive" ) > 0 );
            if ( !edge )
            {
                logger->warn( "Cannot follow {}: {}", address, edge.error().message() );
            }
        }
    }

    auto                    work = boost::asio::make_work_guard( *ctx );
    boost::asio::signal_set signals( *ctx, SIGINT, SIGTERM );
    signals.async_wait(
        [&]( const boost::system::error_code &, int signal_number )
        {
            logger->info( "Signal {} received, shutting down", signal_number );
            service->Stop();
            work.reset();
            ctx->stop();
        } );

    logger->info( "Site {} ({}) running", node.address, node.name );
    std::vector<std::thread> threads;
    for ( unsigned i = 1; i < std::max( 1u, vm["threads"].as<unsigned>() ); ++i )
    {
        threads.emplace_back( [ctx] { ctx->run(); } );
    }
    ctx->run();
    for ( auto &thread : threads )
    {
        thread.join();
    }
    return 0;
}
