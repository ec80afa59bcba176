
#ifndef FEDSYNC_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP
#define FEDSYNC_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP

#include <map>
#include <shared_mutex>

#include "outcome/outcome.hpp"
#include "storage/key_value_store.hpp"

namespace fedsync::storage
{
    /**
     * Simple storage that conforms KeyValueStore interface
     * Used by nodes without a storage path and in tests to avoid integration
     * with RocksDB
     */
    class InMemoryStorage : public KeyValueStore
    {
    public:
        ~InMemoryStorage() override = default;

        outcome::result<std::string> get( const std::string &key ) const override;

        outcome::result<void> put( const std::string &key, std::string value ) override;

        bool contains( const std::string &key ) const override;

        bool empty() const;

        outcome::result<void> remove( const std::string &key ) override;

        outcome::result<QueryResult> query( const std::string &keyPrefix ) const override;

        std::string GetName() override
        {
            return "InMemoryStorage";
        }

    private:
        mutable std::shared_mutex          mutex_;
        std::map<std::string, std::string> storage;
    };

} // namespace fedsync::storage

#endif // FEDSYNC_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP
