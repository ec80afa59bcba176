#include "federation/reconciliation_engine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "content/kv_content_store.hpp"
#include "mock/src/storage/key_value_store_mock.hpp"
#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/federation/content_builders.hpp"
#include "testutil/outcome.hpp"

namespace fedsync::federation
{
    using test::MakeEdge;
    using test::MakeItem;
    using ::testing::_;
    using ::testing::Return;

    namespace
    {
        constexpr base::TimestampMs FIXED_NOW = 1700000000000;

        std::shared_ptr<content::KvContentStore> MakeStore()
        {
            return content::KvContentStore::New( std::make_shared<storage::InMemoryStorage>() );
        }
    }

    class ReconciliationEngineTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            store  = MakeStore();
            engine = ReconciliationEngine::New( "site-a", store );
            ASSERT_TRUE( engine );
            engine->SetClock( [] { return FIXED_NOW; } );
        }

        std::shared_ptr<content::KvContentStore> store;
        std::shared_ptr<ReconciliationEngine>    engine;
        FollowEdge                               edgeToB = MakeEdge( "edge-b", "site-b" );
    };

    TEST_F( ReconciliationEngineTest, ImportStampsProvenance )
    {
        auto result = engine->Reconcile( edgeToB, { MakeItem( "1" ) }, {}, true );
        EXPECT_EQ( result.imported, 1u );

        EXPECT_OUTCOME_TRUE_2( stored, store->Get( "1" ) );
        EXPECT_EQ( stored.federated_from(), "site-b" );
        EXPECT_EQ( stored.federated_at(), FIXED_NOW );
        EXPECT_TRUE( stored.federated_realtime() );
        EXPECT_EQ( stored.content_locator(), "locator-1" );
    }

    TEST_F( ReconciliationEngineTest, ReplayingADeliveryChangesNothing )
    {
        std::vector<ContentItem> added{ MakeItem( "1" ), MakeItem( "2" ) };

        auto first = engine->Reconcile( edgeToB, added, {} );
        EXPECT_EQ( first.imported, 2u );

        auto second = engine->Reconcile( edgeToB, added, {} );
        EXPECT_EQ( second.imported, 0u );
        EXPECT_EQ( second.skipped, 2u );
        EXPECT_EQ( second.failed, 0u );
    }

    TEST_F( ReconciliationEngineTest, LocalOriginIsNeverImportedBack )
    {
        auto result = engine->Reconcile( MakeEdge( "edge-b", "site-b", true ), { MakeItem( "1", "", "site-a" ) }, {} );

        EXPECT_EQ( result.skipped, 1u );
        EXPECT_FALSE( store->Has( "1" ) );
    }

    TEST_F( ReconciliationEngineTest, NonRecursiveEdgeSkipsRefederatedItems )
    {
        auto result = engine->Reconcile( edgeToB, { MakeItem( "native" ), MakeItem( "foreign", "", "site-c" ) }, {} );

        EXPECT_EQ( result.imported, 1u );
        EXPECT_EQ( result.skipped, 1u );
        EXPECT_TRUE( store->Has( "native" ) );
        EXPECT_FALSE( store->Has( "foreign" ) );
    }

    TEST_F( ReconciliationEngineTest, RecursiveEdgeKeepsTheOriginalOrigin )
    {
        auto result = engine->Reconcile( MakeEdge( "edge-b", "site-b", true ), { MakeItem( "foreign", "", "site-c" ) }, {} );
        EXPECT_EQ( result.imported, 1u );

        EXPECT_OUTCOME_TRUE_2( stored, store->Get( "foreign" ) );
        EXPECT_EQ( stored.federated_from(), "site-c" );
    }

    TEST_F( ReconciliationEngineTest, EvictsOnlyCopiesFromTheEdgeTarget )
    {
        EXPECT_OUTCOME_TRUE_1( store->Put( MakeItem( "mine" ) ) );
        EXPECT_OUTCOME_TRUE_1( store->Put( MakeItem( "from-c", "", "site-c" ) ) );
        engine->Reconcile( edgeToB, { MakeItem( "from-b" ) }, {} );

        auto result = engine->Reconcile( edgeToB, {}, { MakeItem( "mine" ), MakeItem( "from-c" ), MakeItem( "from-b" ), MakeItem( "missing" ) } );

        EXPECT_EQ( result.evicted, 1u );
        EXPECT_EQ( result.skipped, 3u );
        EXPECT_TRUE( store->Has( "mine" ) );
        EXPECT_TRUE( store->Has( "from-c" ) );
        EXPECT_FALSE( store->Has( "from-b" ) );
    }

    TEST_F( ReconciliationEngineTest, LargeDeliveriesRunInSeveralBatches )
    {
        std::vector<ContentItem> added;
        for ( int i = 0; i < 45; ++i )
        {
            added.push_back( MakeItem( std::to_string( i ) ) );
        }

        auto result = engine->Reconcile( edgeToB, added, {} );

        EXPECT_EQ( result.imported, 45u );
        EXPECT_OUTCOME_TRUE_2( all, store->Search( {} ) );
        EXPECT_EQ( all.size(), 45u );
    }

    TEST_F( ReconciliationEngineTest, SelfEdgeIsRefused )
    {
        auto result = engine->Reconcile( MakeEdge( "self", "site-a" ), { MakeItem( "1" ) }, { MakeItem( "2" ) } );

        EXPECT_EQ( result.skipped, 2u );
        EXPECT_FALSE( store->Has( "1" ) );
    }

    TEST_F( ReconciliationEngineTest, WriteDenialIsASkip )
    {
        store->SetWritePolicy( []( const ContentItem &, bool ) { return false; } );

        auto result = engine->Reconcile( edgeToB, { MakeItem( "1" ) }, {} );

        EXPECT_EQ( result.skipped, 1u );
        EXPECT_EQ( result.failed, 0u );
    }

    TEST( ReconciliationEngineFailureTest, StorageFailuresAreCountedPerItem )
    {
        auto db = std::make_shared<::testing::NiceMock<storage::KeyValueStoreMock>>();
        EXPECT_CALL( *db, contains( _ ) ).WillRepeatedly( Return( false ) );
        EXPECT_CALL( *db, put( _, _ ) )
            .WillRepeatedly( Return( outcome::result<void>( storage::DatabaseError::IO_ERROR ) ) );

        auto engine = ReconciliationEngine::New( "site-a", content::KvContentStore::New( db ) );
        auto result = engine->Reconcile( MakeEdge( "edge-b", "site-b" ), { MakeItem( "1" ), MakeItem( "2" ) }, {} );

        EXPECT_EQ( result.failed, 2u );
        EXPECT_THAT( result.failedIds, ::testing::UnorderedElementsAre( "1", "2" ) );
    }

    TEST( ReconciliationChainTest, ContentTravelsAlongARecursiveChain )
    {
        auto storeA = MakeStore();
        auto storeB = MakeStore();
        auto engineA = ReconciliationEngine::New( "site-a", storeA );
        auto engineB = ReconciliationEngine::New( "site-b", storeB );

        // B follows C
        auto fromC = engineB->Reconcile( MakeEdge( "b-c", "site-c" ), { MakeItem( "song" ) }, {} );
        EXPECT_EQ( fromC.imported, 1u );
        EXPECT_OUTCOME_TRUE_2( atB, storeB->Get( "song" ) );

        // A follows B without recursion: the re-federated song stays out
        auto direct = engineA->Reconcile( MakeEdge( "a-b", "site-b" ), { atB }, {} );
        EXPECT_EQ( direct.skipped, 1u );
        EXPECT_FALSE( storeA->Has( "song" ) );

        auto recursive = engineA->Reconcile( MakeEdge( "a-b", "site-b", true ), { atB }, {} );
        EXPECT_EQ( recursive.imported, 1u );
        EXPECT_OUTCOME_TRUE_2( atA, storeA->Get( "song" ) );
        EXPECT_EQ( atA.federated_from(), "site-c" );

        // Delivering A's copy back to B (B follows A) must not loop
        auto back = engineB->Reconcile( MakeEdge( "b-a", "site-a", true ), { atA }, {} );
        EXPECT_EQ( back.imported, 0u );
        EXPECT_EQ( back.skipped, 1u );
    }

    class ReconciliationIndexTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            store = MakeStore();
            index = FederationIndex::New( std::make_shared<storage::InMemoryStorage>(), "site-a" );
            ASSERT_TRUE( index );
            EXPECT_OUTCOME_TRUE_1( index->AddFollowedSite( "site-b" ) );
            engine = ReconciliationEngine::New( "site-a", store, index );
            engine->SetClock( [] { return FIXED_NOW; } );
        }

        std::shared_ptr<content::KvContentStore> store;
        std::shared_ptr<FederationIndex>         index;
        std::shared_ptr<ReconciliationEngine>    engine;
    };

    TEST_F( ReconciliationIndexTest, ImportsPointersInsteadOfContent )
    {
        auto edge = MakeEdge( "edge-b", "site-b" );
        edge.set_display_name( "Site B" );

        auto result = engine->Reconcile( edge, { MakeItem( "1" ) }, {} );
        EXPECT_EQ( result.imported, 1u );
        EXPECT_FALSE( store->Has( "1" ) );

        auto id = FederationIndex::MakeEntryId( "site-b", "locator-1" );
        EXPECT_OUTCOME_TRUE_2( entry, index->Get( id ) );
        EXPECT_EQ( entry.source_site_name(), "Site B" );
        EXPECT_EQ( entry.timestamp(), FIXED_NOW );
        EXPECT_EQ( entry.title(), "Item 1" );

        EXPECT_EQ( engine->Reconcile( edge, { MakeItem( "1" ) }, {} ).skipped, 1u );

        auto removed = engine->Reconcile( edge, {}, { MakeItem( "1" ) } );
        EXPECT_EQ( removed.evicted, 1u );
        EXPECT_FALSE( index->Has( id ) );
    }

    TEST_F( ReconciliationIndexTest, UnfollowedSitesCannotWrite )
    {
        auto result = engine->Reconcile( MakeEdge( "edge-x", "site-x" ), { MakeItem( "1" ) }, {} );

        EXPECT_EQ( result.skipped, 1u );
        EXPECT_TRUE( index->GetAllEntries().empty() );
    }

    TEST_F( ReconciliationIndexTest, PurgeRemovesEverySiteEntry )
    {
        auto edge = MakeEdge( "edge-b", "site-b" );
        engine->Reconcile( edge, { MakeItem( "1" ), MakeItem( "2" ) }, {} );

        EXPECT_OUTCOME_TRUE_2( purged, engine->Purge( "site-b", 10 ) );
        EXPECT_EQ( purged, 2u );
        EXPECT_TRUE( index->GetBySite( "site-b" ).empty() );
    }

    TEST_F( ReconciliationEngineTest, PurgeRemovesOnlyThatSitesCopies )
    {
        EXPECT_OUTCOME_TRUE_1( store->Put( MakeItem( "mine" ) ) );
        std::vector<ContentItem> added;
        for ( int i = 0; i < 7; ++i )
        {
            added.push_back( MakeItem( "b" + std::to_string( i ) ) );
        }
        engine->Reconcile( edgeToB, added, {} );
        engine->Reconcile( MakeEdge( "edge-c", "site-c" ), { MakeItem( "c0" ) }, {} );

        EXPECT_OUTCOME_TRUE_2( purged, engine->Purge( "site-b", 3 ) );
        EXPECT_EQ( purged, 7u );
        EXPECT_TRUE( store->Has( "mine" ) );
        EXPECT_TRUE( store->Has( "c0" ) );
        EXPECT_FALSE( store->Has( "b0" ) );
    }
} // namespace fedsync::federation
