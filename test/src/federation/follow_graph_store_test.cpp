#include "federation/follow_graph_store.hpp"

#include <gtest/gtest.h>

#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/outcome.hpp"

namespace fedsync::federation
{
    class FollowGraphStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            db    = std::make_shared<storage::InMemoryStorage>();
            graph = FollowGraphStore::New( db, "site-a" );
            ASSERT_TRUE( graph );
        }

        std::shared_ptr<storage::InMemoryStorage> db;
        std::shared_ptr<FollowGraphStore>         graph;
    };

    TEST_F( FollowGraphStoreTest, AddEdgeFillsDefaults )
    {
        EXPECT_OUTCOME_TRUE_2( edge, graph->AddEdge( "site-b", "", false ) );
        EXPECT_FALSE( edge.id().empty() );
        EXPECT_EQ( edge.target_address(), "site-b" );
        EXPECT_EQ( edge.display_name(), "site-b" );
        EXPECT_FALSE( edge.recursive() );
        EXPECT_EQ( edge.current_depth(), 0u );
        EXPECT_EQ( edge.subscription_type(), DIRECT_SUBSCRIPTION );
        EXPECT_GT( edge.created_at(), 0 );

        EXPECT_TRUE( graph->IsFollowing( "site-b" ) );
        EXPECT_TRUE( db->contains( std::string( FollowGraphStore::EDGE_PREFIX ) + edge.id() ) );
    }

    TEST_F( FollowGraphStoreTest, TypedFailures )
    {
        EXPECT_EQ( graph->AddEdge( "site-a", "me", false ).error(), FollowGraphStore::Error::SELF_FOLLOW );
        EXPECT_EQ( graph->AddEdge( "", "nobody", false ).error(), FollowGraphStore::Error::EMPTY_TARGET );

        EXPECT_OUTCOME_TRUE_1( graph->AddEdge( "site-b", "B", true ) );
        EXPECT_EQ( graph->AddEdge( "site-b", "B again", false ).error(), FollowGraphStore::Error::ALREADY_FOLLOWING );

        EXPECT_EQ( graph->RemoveEdge( "unknown" ).error(), FollowGraphStore::Error::EDGE_NOT_FOUND );
        EXPECT_EQ( graph->GetEdge( "unknown" ).error(), FollowGraphStore::Error::EDGE_NOT_FOUND );
        EXPECT_EQ( graph->GetEdges().size(), 1u );
    }

    TEST_F( FollowGraphStoreTest, EdgesSurviveRestart )
    {
        EXPECT_OUTCOME_TRUE_2( b, graph->AddEdge( "site-b", "Site B", true, { "site-x" } ) );
        EXPECT_OUTCOME_TRUE_2( c, graph->AddEdge( "site-c", "Site C", false ) );
        EXPECT_OUTCOME_TRUE_1( graph->RemoveEdge( c.id() ) );

        // An unreadable record and a self edge written behind the store's back are skipped
        EXPECT_OUTCOME_TRUE_1( db->put( std::string( FollowGraphStore::EDGE_PREFIX ) + "garbage", "\xff\xff" ) );
        FollowEdge self;
        self.set_id( "self" );
        self.set_target_address( "site-a" );
        EXPECT_OUTCOME_TRUE_1( db->put( std::string( FollowGraphStore::EDGE_PREFIX ) + "self", self.SerializeAsString() ) );

        auto restarted = FollowGraphStore::New( db, "site-a" );
        EXPECT_OUTCOME_TRUE_2( loaded, restarted->Load() );
        EXPECT_EQ( loaded, 1u );

        EXPECT_OUTCOME_TRUE_2( edge, restarted->GetEdge( b.id() ) );
        EXPECT_EQ( edge.display_name(), "Site B" );
        EXPECT_TRUE( edge.recursive() );
        ASSERT_EQ( edge.follow_chain_size(), 1 );
        EXPECT_EQ( edge.follow_chain( 0 ), "site-x" );
        EXPECT_FALSE( restarted->FindByTarget( "site-c" ).has_value() );
    }
} // namespace fedsync::federation
