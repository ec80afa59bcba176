#include "federation/follow_graph_store.hpp"

#include <mutex>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "base/util.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( fedsync::federation, FollowGraphStore::Error, e )
{
    using E = fedsync::federation::FollowGraphStore::Error;
    switch ( e )
    {
        case E::SELF_FOLLOW:
            return "A site cannot follow itself";
        case E::EMPTY_TARGET:
            return "Target address is empty";
        case E::ALREADY_FOLLOWING:
            return "The site is already followed";
        case E::EDGE_NOT_FOUND:
            return "No follow edge with this id";
    }
    return "Unknown error";
}

namespace fedsync::federation
{
    std::shared_ptr<FollowGraphStore> FollowGraphStore::New( std::shared_ptr<storage::KeyValueStore> db,
                                                             std::string                             localAddress )
    {
        if ( !db || localAddress.empty() )
        {
            return nullptr;
        }
        return std::shared_ptr<FollowGraphStore>( new FollowGraphStore( std::move( db ), std::move( localAddress ) ) );
    }

    FollowGraphStore::FollowGraphStore( std::shared_ptr<storage::KeyValueStore> db, std::string localAddress ) :
        db_( std::move( db ) ), localAddress_( std::move( localAddress ) )
    {
    }

    std::string FollowGraphStore::KeyFor( const std::string &id )
    {
        return std::string( EDGE_PREFIX ) + id;
    }

    outcome::result<size_t> FollowGraphStore::Load()
    {
        OUTCOME_TRY( ( auto &&, records ), db_->query( std::string( EDGE_PREFIX ) ) );

        std::map<std::string, FollowEdge> loaded;
        for ( const auto &[key, record] : records )
        {
            FollowEdge edge;
            if ( !edge.ParseFromString( record ) )
            {
                m_logger->error( "Skipping unreadable follow edge record {}", key );
                continue;
            }
            if ( edge.target_address() == localAddress_ )
            {
                m_logger->warn( "Ignoring persisted self edge {}", edge.id() );
                continue;
            }
            loaded.emplace( edge.id(), std::move( edge ) );
        }

        std::unique_lock lock( mutex_ );
        edges_ = std::move( loaded );
        m_logger->info( "Loaded {} follow edges", edges_.size() );
        return edges_.size();
    }

    outcome::result<FollowEdge> FollowGraphStore::AddEdge( const std::string       &targetAddress,
                                                           const std::string       &displayName,
                                                           bool                     recursive,
                                                           std::vector<std::string> followChain )
    {
        if ( targetAddress.empty() )
        {
            return Error::EMPTY_TARGET;
        }
        if ( targetAddress == localAddress_ )
        {
            m_logger->warn( "Refusing to follow own address {}", targetAddress );
            return Error::SELF_FOLLOW;
        }

        std::unique_lock lock( mutex_ );
        for ( const auto &entry : edges_ )
        {
            if ( entry.second.target_address() == targetAddress )
            {
                return Error::ALREADY_FOLLOWING;
            }
        }

        FollowEdge edge;
        edge.set_id( boost::uuids::to_string( boost::uuids::random_generator()() ) );
        edge.set_target_address( targetAddress );
        edge.set_display_name( displayName.empty() ? targetAddress : displayName );
        edge.set_recursive( recursive );
        for ( auto &hop : followChain )
        {
            edge.add_follow_chain( std::move( hop ) );
        }
        edge.set_current_depth( 0 );
        edge.set_subscription_type( std::string( DIRECT_SUBSCRIPTION ) );
        edge.set_created_at( base::NowMillis() );

        BOOST_OUTCOME_TRYV2( auto &&, db_->put( KeyFor( edge.id() ), edge.SerializeAsString() ) );
        edges_.emplace( edge.id(), edge );

        m_logger->info( "Following {} ({}, {})", targetAddress, edge.id(), recursive ? "recursive" : "originals only" );
        return edge;
    }

    outcome::result<FollowEdge> FollowGraphStore::RemoveEdge( const std::string &id )
    {
        std::unique_lock lock( mutex_ );
        auto             it = edges_.find( id );
        if ( it == edges_.end() )
        {
            return Error::EDGE_NOT_FOUND;
        }
        BOOST_OUTCOME_TRYV2( auto &&, db_->remove( KeyFor( id ) ) );

        FollowEdge removed = std::move( it->second );
        edges_.erase( it );
        m_logger->info( "Unfollowed {} ({})", removed.target_address(), id );
        return removed;
    }

    outcome::result<FollowEdge> FollowGraphStore::GetEdge( const std::string &id ) const
    {
        std::shared_lock lock( mutex_ );
        auto             it = edges_.find( id );
        if ( it == edges_.end() )
        {
            return Error::EDGE_NOT_FOUND;
        }
        return it->second;
    }

    std::optional<FollowEdge> FollowGraphStore::FindByTarget( const std::string &targetAddress ) const
    {
        std::shared_lock lock( mutex_ );
        for ( const auto &entry : edges_ )
        {
            if ( entry.second.target_address() == targetAddress )
            {
                return entry.second;
            }
        }
        return std::nullopt;
    }

    bool FollowGraphStore::IsFollowing( const std::string &targetAddress ) const
    {
        return FindByTarget( targetAddress ).has_value();
    }

    std::vector<FollowEdge> FollowGraphStore::GetEdges() const
    {
        std::shared_lock        lock( mutex_ );
        std::vector<FollowEdge> edges;
        edges.reserve( edges_.size() );
        for ( const auto &entry : edges_ )
        {
            edges.push_back( entry.second );
        }
        return edges;
    }
} // namespace fedsync::federation
