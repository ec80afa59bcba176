#include "federation/session_manager.hpp"

#include <thread>

#include <gtest/gtest.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/system/error_code.hpp>

#include "content/kv_content_store.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/federation/content_builders.hpp"
#include "testutil/outcome.hpp"
#include "testutil/wait_condition.hpp"

namespace fedsync::federation
{
    using std::chrono::milliseconds;
    using test::MakeEdge;
    using test::MakeItem;

    namespace
    {
        /**
         * @brief Transport whose reachability is switched by the test
         */
        class ScriptedTransport : public Transport
        {
        public:
            TransportKind Kind() const override
            {
                return TransportKind::RealTime;
            }

            outcome::result<void> Start( const FollowEdge &, milliseconds openTimeout ) override
            {
                ++starts;
                lastOpenTimeout = openTimeout.count();
                if ( !reachable )
                {
                    return outcome::failure( boost::system::errc::make_error_code( boost::system::errc::host_unreachable ) );
                }
                return outcome::success();
            }

            void Stop( const std::string & ) override
            {
                ++stops;
            }

            outcome::result<std::vector<ContentItem>> Snapshot( const FollowEdge &, size_t limit ) override
            {
                std::lock_guard lock( mutex_ );
                if ( limit != 0 && snapshot_.size() > limit )
                {
                    return std::vector<ContentItem>( snapshot_.begin(), snapshot_.begin() + limit );
                }
                return snapshot_;
            }

            void SetSnapshot( std::vector<ContentItem> items )
            {
                std::lock_guard lock( mutex_ );
                snapshot_ = std::move( items );
            }

            void Push( const std::string &edgeId, std::vector<ContentItem> items, bool isRemoval = false )
            {
                Deliver( edgeId, std::move( items ), isRemoval, true );
            }

            std::atomic<bool>    reachable{ true };
            std::atomic<int>     starts{ 0 };
            std::atomic<int>     stops{ 0 };
            std::atomic<int64_t> lastOpenTimeout{ 0 };

        private:
            std::mutex               mutex_;
            std::vector<ContentItem> snapshot_;
        };
    }

    class SessionManagerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            options.openTimeout             = milliseconds( 50 );
            options.openTimeoutStep         = milliseconds( 10 );
            options.minOpenTimeout          = milliseconds( 20 );
            options.maxConnectAttempts      = 3;
            options.connectBackoffBase      = milliseconds( 5 );
            options.connectBackoffCap       = milliseconds( 20 );
            options.backgroundRetryInterval = milliseconds( 50 );
            options.healthCheckInterval     = milliseconds( 20 );
            options.maxIdle                 = milliseconds( 60000 );
            options.reconnectBackoffBase    = milliseconds( 5 );
            options.reconnectBackoffCap     = milliseconds( 20 );
            options.maxReconnectAttempts    = 2;

            store     = content::KvContentStore::New( std::make_shared<storage::InMemoryStorage>() );
            engine    = ReconciliationEngine::New( "site-a", store );
            transport = std::make_shared<ScriptedTransport>();

            io   = std::make_shared<boost::asio::io_context>();
            work = std::make_unique<WorkGuard>( boost::asio::make_work_guard( *io ) );
            runner = std::thread( [this] { io->run(); } );
        }

        void TearDown() override
        {
            manager.reset();
            work.reset();
            io->stop();
            if ( runner.joinable() )
            {
                runner.join();
            }
        }

        void CreateManager()
        {
            manager = SessionManager::New( io, engine, transport, options );
            ASSERT_TRUE( manager );
        }

        std::function<bool()> StatusIs( const std::string &edgeId, SessionStatus status )
        {
            return [this, edgeId, status] { return manager->GetSessionStatus( edgeId ) == status; };
        }

        using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

        FederationOptions                        options;
        std::shared_ptr<content::KvContentStore> store;
        std::shared_ptr<ReconciliationEngine>    engine;
        std::shared_ptr<ScriptedTransport>       transport;
        std::shared_ptr<boost::asio::io_context> io;
        std::unique_ptr<WorkGuard>               work;
        std::thread                              runner;
        std::shared_ptr<SessionManager>          manager;
        FollowEdge                               edge = MakeEdge( "edge-b", "site-b" );
    };

    TEST_F( SessionManagerTest, RejectsMissingCollaboratorsAndBadOptions )
    {
        EXPECT_FALSE( SessionManager::New( nullptr, engine, transport, options ) );
        EXPECT_FALSE( SessionManager::New( io, nullptr, transport, options ) );
        EXPECT_FALSE( SessionManager::New( io, engine, nullptr, options ) );

        auto bad           = options;
        bad.minOpenTimeout = milliseconds( 0 );
        EXPECT_FALSE( SessionManager::New( io, engine, transport, bad ) );
    }

    TEST_F( SessionManagerTest, OpenTimeoutShrinksPerAttempt )
    {
        options = FederationOptions{};
        CreateManager();

        EXPECT_EQ( manager->OpenTimeout( 0 ), milliseconds( 15000 ) );
        EXPECT_EQ( manager->OpenTimeout( 1 ), milliseconds( 13000 ) );
        EXPECT_EQ( manager->OpenTimeout( 5 ), milliseconds( 5000 ) );
        EXPECT_EQ( manager->OpenTimeout( 9 ), milliseconds( 5000 ) );
    }

    TEST_F( SessionManagerTest, ConnectRunsInitialSyncThenAppliesDeliveries )
    {
        transport->SetSnapshot( { MakeItem( "1" ), MakeItem( "2" ), MakeItem( "refederated", "", "site-c" ) } );
        CreateManager();

        manager->AddEdge( edge );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Active ), milliseconds( 2000 ), "session active", nullptr );
        ASSERT_WAIT_FOR_CONDITION( [this] { return store->Has( "2" ); }, milliseconds( 2000 ), "initial sync", nullptr );
        EXPECT_FALSE( store->Has( "refederated" ) );
        EXPECT_EQ( transport->lastOpenTimeout.load(), 50 );

        transport->Push( "edge-b", { MakeItem( "3" ) } );
        ASSERT_WAIT_FOR_CONDITION( [this] { return store->Has( "3" ); }, milliseconds( 2000 ), "live import", nullptr );

        transport->Push( "edge-b", { MakeItem( "1" ) }, true );
        ASSERT_WAIT_FOR_CONDITION( [this] { return !store->Has( "1" ); }, milliseconds( 2000 ), "live eviction", nullptr );

        // Deliveries for edges without a session are dropped
        transport->Push( "edge-x", { MakeItem( "x" ) } );

        auto sessions = manager->GetSessions();
        ASSERT_EQ( sessions.size(), 1u );
        EXPECT_EQ( sessions[0].targetAddress, "site-b" );
        EXPECT_EQ( sessions[0].status, SessionStatus::Active );
        EXPECT_GE( sessions[0].totals.imported, 3u );
        EXPECT_FALSE( store->Has( "x" ) );
    }

    TEST_F( SessionManagerTest, UnreachableSiteFailsThenRecoversInBackground )
    {
        transport->reachable = false;
        CreateManager();

        manager->AddEdge( edge );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Failed ), milliseconds( 2000 ), "session failed", nullptr );
        EXPECT_GE( transport->starts.load(), options.maxConnectAttempts );

        transport->reachable = true;
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Active ), milliseconds( 2000 ), "background retry", nullptr );
        // Background attempts use the shortest timeout
        EXPECT_EQ( transport->lastOpenTimeout.load(), 20 );
    }

    TEST_F( SessionManagerTest, IdleSessionIsRestarted )
    {
        options.maxIdle = milliseconds( 30 );
        CreateManager();

        manager->AddEdge( edge );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Active ), milliseconds( 2000 ), "session active", nullptr );

        // Idle, then Degraded, then Reconnecting, which restarts the transport
        auto restarted = [this] { return transport->stops.load() > 0 && transport->starts.load() >= 2; };
        ASSERT_WAIT_FOR_CONDITION( restarted, milliseconds( 3000 ), "transport restarted", nullptr );
    }

    TEST_F( SessionManagerTest, FailedReconnectsEndInFailedAndDeliveryRevives )
    {
        options.maxIdle                 = milliseconds( 30 );
        options.backgroundRetryInterval = milliseconds( 60000 );
        CreateManager();

        manager->AddEdge( edge );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Active ), milliseconds( 2000 ), "session active", nullptr );

        transport->reachable = false;
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Failed ), milliseconds( 3000 ), "reconnects exhausted", nullptr );
        // The first connect plus exactly maxReconnectAttempts reconnects
        EXPECT_EQ( transport->starts.load(), 1 + options.maxReconnectAttempts );

        // Any delivery proves the site is alive again
        transport->Push( "edge-b", { MakeItem( "alive" ) } );
        ASSERT_WAIT_FOR_CONDITION( [this] { return store->Has( "alive" ); }, milliseconds( 2000 ), "delivery applied", nullptr );
        EXPECT_EQ( manager->GetSessionStatus( "edge-b" ), SessionStatus::Active );
    }

    TEST_F( SessionManagerTest, IdleSessionDegradesThenReconnectsAndRecoversOnDelivery )
    {
        options.maxIdle              = milliseconds( 30 );
        options.healthCheckInterval  = milliseconds( 100 );
        options.reconnectBackoffBase = milliseconds( 400 );
        options.reconnectBackoffCap  = milliseconds( 400 );
        CreateManager();

        manager->AddEdge( edge );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Active ), milliseconds( 2000 ), "session active", nullptr );
        transport->reachable = false;

        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Degraded ), milliseconds( 2000 ), "degraded", nullptr );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Reconnecting ), milliseconds( 2000 ), "reconnecting", nullptr );
        EXPECT_EQ( transport->starts.load(), 1 );

        transport->Push( "edge-b", { MakeItem( "fresh" ) } );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Active ), milliseconds( 2000 ), "active again", nullptr );
        // The pending reconnect was dropped
        EXPECT_EQ( transport->starts.load(), 1 );
        EXPECT_TRUE( store->Has( "fresh" ) );
    }

    TEST_F( SessionManagerTest, RemoveEdgeStopsTheSession )
    {
        CreateManager();

        manager->AddEdge( edge );
        ASSERT_WAIT_FOR_CONDITION( StatusIs( "edge-b", SessionStatus::Active ), milliseconds( 2000 ), "session active", nullptr );

        EXPECT_TRUE( manager->RemoveEdge( "edge-b" ) );
        EXPECT_FALSE( manager->RemoveEdge( "edge-b" ) );
        EXPECT_EQ( manager->SessionCount(), 0u );
        EXPECT_FALSE( manager->GetSessionStatus( "edge-b" ) );
        EXPECT_GE( transport->stops.load(), 1 );

        transport->Push( "edge-b", { MakeItem( "late" ) } );
        std::this_thread::sleep_for( milliseconds( 50 ) );
        EXPECT_FALSE( store->Has( "late" ) );
    }

    TEST_F( SessionManagerTest, StopAllClearsEverySession )
    {
        CreateManager();

        manager->AddEdge( edge );
        manager->AddEdge( MakeEdge( "edge-c", "site-c" ) );
        EXPECT_EQ( manager->SessionCount(), 2u );

        manager->StopAll();
        EXPECT_EQ( manager->SessionCount(), 0u );
    }
} // namespace fedsync::federation
