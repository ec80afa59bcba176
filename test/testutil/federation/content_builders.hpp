#ifndef FEDSYNC_TESTUTIL_CONTENT_BUILDERS_HPP
#define FEDSYNC_TESTUTIL_CONTENT_BUILDERS_HPP

#include <string>

#include "federation/federation_types.hpp"

namespace fedsync::test
{
    inline federation::ContentItem MakeItem( const std::string &id,
                                             const std::string &name          = "",
                                             const std::string &federatedFrom = "" )
    {
        federation::ContentItem item;
        item.set_id( id );
        item.set_name( name.empty() ? "Item " + id : name );
        item.set_category_id( "music" );
        item.set_content_locator( "locator-" + id );
        if ( !federatedFrom.empty() )
        {
            item.set_federated_from( federatedFrom );
        }
        return item;
    }

    inline federation::FollowEdge MakeEdge( const std::string &id, const std::string &target, bool recursive = false )
    {
        federation::FollowEdge edge;
        edge.set_id( id );
        edge.set_target_address( target );
        edge.set_display_name( target );
        edge.set_recursive( recursive );
        edge.set_subscription_type( std::string( federation::DIRECT_SUBSCRIPTION ) );
        return edge;
    }
} // namespace fedsync::test

#endif // FEDSYNC_TESTUTIL_CONTENT_BUILDERS_HPP
