#include "content/kv_content_store.hpp"

#include <gtest/gtest.h>

#include "crypto/sha/sha256.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/federation/content_builders.hpp"
#include "testutil/outcome.hpp"

namespace fedsync::content
{
    using test::MakeItem;

    class KvContentStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            db    = std::make_shared<storage::InMemoryStorage>();
            store = KvContentStore::New( db );
            ASSERT_TRUE( store );
        }

        std::shared_ptr<storage::InMemoryStorage> db;
        std::shared_ptr<KvContentStore>           store;
    };

    TEST_F( KvContentStoreTest, PutReturnsHashOfTheRecord )
    {
        auto item = MakeItem( "a" );
        EXPECT_OUTCOME_TRUE_2( hash, store->Put( item ) );
        EXPECT_EQ( hash, crypto::sha256Hex( item.SerializeAsString() ) );
        EXPECT_EQ( hash.size(), 64 );

        EXPECT_TRUE( store->Has( "a" ) );
        EXPECT_OUTCOME_TRUE_2( stored, store->Get( "a" ) );
        EXPECT_EQ( stored.name(), item.name() );
        EXPECT_TRUE( db->contains( KvContentStore::KeyFor( "a" ) ) );
    }

    TEST_F( KvContentStoreTest, ItemWithoutIdIsInvalid )
    {
        auto put = store->Put( MakeItem( "" ) );
        ASSERT_FALSE( put );
        EXPECT_EQ( put.error(), ContentStore::Error::INVALID_ITEM );
    }

    TEST_F( KvContentStoreTest, DeleteUnknownItem )
    {
        auto deleted = store->Delete( "missing" );
        ASSERT_FALSE( deleted );
        EXPECT_EQ( deleted.error(), ContentStore::Error::NOT_FOUND );
    }

    TEST_F( KvContentStoreTest, ListenersSeePutsAndDeletes )
    {
        std::vector<std::string> added;
        std::vector<std::string> removed;
        auto                     id = store->AddChangeListener(
            [&]( const std::vector<ContentItem> &a, const std::vector<ContentItem> &r )
            {
                for ( const auto &item : a )
                {
                    added.push_back( item.id() );
                }
                for ( const auto &item : r )
                {
                    removed.push_back( item.id() );
                }
            } );

        EXPECT_OUTCOME_TRUE_1( store->Put( MakeItem( "a" ) ) );
        EXPECT_OUTCOME_TRUE_1( store->Delete( "a" ) );
        store->RemoveChangeListener( id );
        EXPECT_OUTCOME_TRUE_1( store->Put( MakeItem( "b" ) ) );

        EXPECT_EQ( added, std::vector<std::string>{ "a" } );
        EXPECT_EQ( removed, std::vector<std::string>{ "a" } );
    }

    TEST_F( KvContentStoreTest, WritePolicyDenial )
    {
        store->SetWritePolicy( []( const ContentItem &item, bool isDelete )
                               { return isDelete || !item.has_federated_from(); } );

        auto denied = store->Put( MakeItem( "remote", "", "site-b" ) );
        ASSERT_FALSE( denied );
        EXPECT_EQ( denied.error(), ContentStore::Error::WRITE_DENIED );
        EXPECT_FALSE( store->Has( "remote" ) );

        EXPECT_OUTCOME_TRUE_1( store->Put( MakeItem( "local" ) ) );
        EXPECT_OUTCOME_TRUE_1( store->Delete( "local" ) );
    }

    TEST_F( KvContentStoreTest, SearchAndCursorSkipCorruptRecords )
    {
        for ( int i = 0; i < 5; ++i )
        {
            EXPECT_OUTCOME_TRUE_1( store->Put( MakeItem( "item" + std::to_string( i ), "", i % 2 ? "site-b" : "" ) ) );
        }
        EXPECT_OUTCOME_TRUE_1( db->put( KvContentStore::KeyFor( "broken" ), "\xff\xff\xff" ) );

        ContentQuery federated;
        federated.filter = []( const ContentItem &item ) { return item.has_federated_from(); };
        EXPECT_OUTCOME_TRUE_2( found, store->Search( federated ) );
        EXPECT_EQ( found.size(), 2 );

        ContentQuery limited;
        limited.limit = 3;
        EXPECT_OUTCOME_TRUE_2( first_three, store->Search( limited ) );
        EXPECT_EQ( first_three.size(), 3 );

        auto   cursor = store->Iterate( ContentQuery{} );
        size_t total  = 0;
        size_t rounds = 0;
        while ( !cursor->Done() )
        {
            EXPECT_OUTCOME_TRUE_2( batch, cursor->Next( 2 ) );
            total += batch.size();
            ++rounds;
        }
        EXPECT_EQ( total, 5 );
        EXPECT_GE( rounds, 3 );
    }
} // namespace fedsync::content
