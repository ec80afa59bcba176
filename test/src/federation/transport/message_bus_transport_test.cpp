#include "federation/transport/message_bus_transport.hpp"

#include <gtest/gtest.h>

#include "content/kv_content_store.hpp"
#include "federation/in_process_message_bus.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/federation/content_builders.hpp"
#include "testutil/federation/delivery_recorder.hpp"
#include "testutil/outcome.hpp"
#include "testutil/wait_condition.hpp"

namespace fedsync::federation
{
    using std::chrono::milliseconds;
    using test::MakeEdge;
    using test::MakeItem;

    class MessageBusTransportTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            options.historicalSyncWindow       = milliseconds( 2000 );
            options.historicalSyncPollInterval = milliseconds( 50 );
            options.subscriberDiscoveryTimeout = milliseconds( 50 );
            options.subscriberPollInterval     = milliseconds( 5 );
            options.subscriptionWaitTimeout    = milliseconds( 50 );
            options.snapshotOpenTimeout        = milliseconds( 50 );
            options.snapshotRetryBase          = milliseconds( 5 );
            options.snapshotRetryCap           = milliseconds( 10 );

            bus       = std::make_shared<InProcessMessageBus>();
            directory = std::make_shared<InProcessSiteDirectory>();
            siteA     = content::KvContentStore::New( std::make_shared<storage::InMemoryStorage>() );
            directory->Register( "site-a", siteA );

            publisher = MessageBusTransport::New( "site-a", "Site A", directory, bus, options );
            follower  = MessageBusTransport::New( "site-b", "Site B", directory, bus, options );
            ASSERT_TRUE( publisher );
            ASSERT_TRUE( follower );
            follower->SetDeliveryHandler( recorder.Handler() );
        }

        void TearDown() override
        {
            follower->Stop( edge.id() );
        }

        static std::vector<uint8_t> Encode( const pb::SyncUpdate &update )
        {
            auto bytes = update.SerializeAsString();
            return { bytes.begin(), bytes.end() };
        }

        FederationOptions                        options;
        std::shared_ptr<InProcessMessageBus>     bus;
        std::shared_ptr<InProcessSiteDirectory>  directory;
        std::shared_ptr<content::KvContentStore> siteA;
        std::shared_ptr<MessageBusTransport>     publisher;
        std::shared_ptr<MessageBusTransport>     follower;
        test::DeliveryRecorder                   recorder;
        FollowEdge                               edge = MakeEdge( "edge-a", "site-a" );
    };

    TEST_F( MessageBusTransportTest, TopicIsDerivedFromTheAddress )
    {
        EXPECT_EQ( MessageBusTransport::TopicFor( "site-a" ), "fedsync/site/site-a/updates" );
        EXPECT_STREQ( follower->Name(), "message-bus" );
        EXPECT_FALSE( MessageBusTransport::New( "site-a", "", directory, nullptr, options ) );
    }

    TEST_F( MessageBusTransportTest, PublishedChangesReachFollowers )
    {
        EXPECT_OUTCOME_TRUE_1( follower->Start( edge, milliseconds( 100 ) ) );
        EXPECT_EQ( bus->SubscriberCount( MessageBusTransport::TopicFor( "site-a" ) ), 1u );

        EXPECT_OUTCOME_TRUE_1( publisher->PublishLocalChanges( { MakeItem( "1" ), MakeItem( "2" ) }, { MakeItem( "0" ) } ) );

        EXPECT_TRUE( recorder.Contains( "1" ) );
        EXPECT_TRUE( recorder.Contains( "2" ) );
        EXPECT_TRUE( recorder.Contains( "0", true ) );
        for ( const auto &delivery : recorder.Deliveries() )
        {
            EXPECT_EQ( delivery.edgeId, "edge-a" );
        }
        EXPECT_EQ( bus->DiscoveryRequests(), 0u );
    }

    TEST_F( MessageBusTransportTest, MalformedAndForeignUpdatesAreDropped )
    {
        EXPECT_OUTCOME_TRUE_1( follower->Start( edge, milliseconds( 100 ) ) );
        auto topic = MessageBusTransport::TopicFor( "site-a" );

        EXPECT_OUTCOME_TRUE_1( bus->Publish( topic, { 0xff, 0xff, 0xff } ) );

        pb::SyncUpdate spoofed;
        spoofed.set_site_id( "site-x" );
        *spoofed.add_added() = MakeItem( "spoof" );
        EXPECT_OUTCOME_TRUE_1( bus->Publish( topic, Encode( spoofed ) ) );

        EXPECT_FALSE( recorder.Contains( "spoof" ) );

        pb::SyncUpdate genuine;
        genuine.set_site_id( "site-a" );
        *genuine.add_added() = MakeItem( "real" );
        EXPECT_OUTCOME_TRUE_1( bus->Publish( topic, Encode( genuine ) ) );
        EXPECT_TRUE( recorder.Contains( "real" ) );
    }

    TEST_F( MessageBusTransportTest, HistoricalSyncDeliversHeadState )
    {
        EXPECT_OUTCOME_TRUE_1( siteA->Put( MakeItem( "old" ) ) );
        EXPECT_OUTCOME_TRUE_1( siteA->Put( MakeItem( "refederated", "", "site-c" ) ) );

        EXPECT_OUTCOME_TRUE_1( follower->Start( edge, milliseconds( 100 ) ) );

        auto received = [this] { return recorder.Contains( "old" ); };
        ASSERT_WAIT_FOR_CONDITION( received, milliseconds( 1000 ), "head state delivered", nullptr );
        EXPECT_FALSE( recorder.Contains( "refederated" ) );
        EXPECT_FALSE( recorder.Deliveries().front().realtime );

        // Items added later are picked up by the next poll
        EXPECT_OUTCOME_TRUE_1( siteA->Put( MakeItem( "newer" ) ) );
        auto polled = [this] { return recorder.Contains( "newer" ); };
        ASSERT_WAIT_FOR_CONDITION( polled, milliseconds( 1000 ), "second poll delivered", nullptr );
    }

    TEST_F( MessageBusTransportTest, StopCancelsTheHistoricalSync )
    {
        options.historicalSyncWindow       = milliseconds( 60000 );
        options.historicalSyncPollInterval = milliseconds( 30000 );
        auto slow = MessageBusTransport::New( "site-b", "", directory, bus, options );

        EXPECT_OUTCOME_TRUE_1( slow->Start( edge, milliseconds( 100 ) ) );

        auto start = std::chrono::steady_clock::now();
        slow->Stop( edge.id() );
        EXPECT_LT( std::chrono::steady_clock::now() - start, milliseconds( 5000 ) );
        EXPECT_EQ( bus->SubscriberCount( MessageBusTransport::TopicFor( "site-a" ) ), 0u );
    }

    TEST_F( MessageBusTransportTest, PublishingWithoutSubscribersAsksForThemFirst )
    {
        EXPECT_OUTCOME_TRUE_1( publisher->PublishLocalChanges( {}, {} ) );
        EXPECT_EQ( bus->PublishedCount(), 0u );

        EXPECT_OUTCOME_TRUE_1( publisher->PublishLocalChanges( { MakeItem( "1" ) }, {} ) );
        EXPECT_EQ( bus->DiscoveryRequests(), 1u );
        EXPECT_EQ( bus->PublishedCount(), 1u );
    }

    TEST_F( MessageBusTransportTest, SnapshotReadsTheHeadState )
    {
        EXPECT_OUTCOME_TRUE_1( siteA->Put( MakeItem( "1" ) ) );
        EXPECT_OUTCOME_TRUE_1( siteA->Put( MakeItem( "2" ) ) );

        EXPECT_OUTCOME_TRUE_2( items, follower->Snapshot( edge, 1 ) );
        EXPECT_EQ( items.size(), 1u );

        EXPECT_FALSE( follower->Snapshot( MakeEdge( "edge-x", "site-x" ), 10 ) );
    }
} // namespace fedsync::federation
