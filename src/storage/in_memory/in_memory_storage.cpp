
#include "storage/in_memory/in_memory_storage.hpp"

#include <mutex>

#include "storage/database_error.hpp"

namespace fedsync::storage
{
    outcome::result<std::string> InMemoryStorage::get( const std::string &key ) const
    {
        std::shared_lock lock( mutex_ );
        auto             it = storage.find( key );
        if ( it != storage.end() )
        {
            return it->second;
        }

        return DatabaseError::NOT_FOUND;
    }

    outcome::result<void> InMemoryStorage::put( const std::string &key, std::string value )
    {
        if ( key.empty() )
        {
            return DatabaseError::INVALID_ARGUMENT;
        }
        std::unique_lock lock( mutex_ );
        storage[key] = std::move( value );
        return outcome::success();
    }

    bool InMemoryStorage::contains( const std::string &key ) const
    {
        std::shared_lock lock( mutex_ );
        return storage.find( key ) != storage.end();
    }

    bool InMemoryStorage::empty() const
    {
        std::shared_lock lock( mutex_ );
        return storage.empty();
    }

    outcome::result<void> InMemoryStorage::remove( const std::string &key )
    {
        std::unique_lock lock( mutex_ );
        storage.erase( key );
        return outcome::success();
    }

    outcome::result<KeyValueStore::QueryResult> InMemoryStorage::query( const std::string &keyPrefix ) const
    {
        std::shared_lock lock( mutex_ );
        QueryResult      results;
        for ( auto it = storage.lower_bound( keyPrefix );
              it != storage.end() && it->first.compare( 0, keyPrefix.size(), keyPrefix ) == 0;
              ++it )
        {
            results.emplace( it->first, it->second );
        }
        return results;
    }
} // namespace fedsync::storage
