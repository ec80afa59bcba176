
#ifndef FEDSYNC_ROCKSDB_HPP
#define FEDSYNC_ROCKSDB_HPP

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>

#include <memory>
#include <string_view>

#include "base/logger.hpp"
#include "storage/key_value_store.hpp"

namespace fedsync::storage
{

    /**
     * @brief An implementation of KeyValueStore interface, which uses
     * rocksdb as underlying storage.
     */
    class rocksdb : public KeyValueStore
    {
    public:
        using Iterator     = ::ROCKSDB_NAMESPACE::Iterator;
        using Options      = ::ROCKSDB_NAMESPACE::Options;
        using ReadOptions  = ::ROCKSDB_NAMESPACE::ReadOptions;
        using WriteOptions = ::ROCKSDB_NAMESPACE::WriteOptions;
        using DB           = ::ROCKSDB_NAMESPACE::DB;
        using Status       = ::ROCKSDB_NAMESPACE::Status;
        using Slice        = ::ROCKSDB_NAMESPACE::Slice;

        ~rocksdb() override;

        /**
         * @brief Factory method to create an instance of rocksdb class.
         * @param path filesystem path where database is going to be
         * @param options rocksdb options, such as caching, logging, etc.
         * @return instance of rocksdb
         */
        static outcome::result<std::shared_ptr<rocksdb>> create( std::string_view path,
                                                                 const Options   &options = Options() );

        /**
         * @brief Set write options, which are used in @see rocksdb#put
         * @param wo options
         */
        void setWriteOptions( WriteOptions wo );

        outcome::result<std::string> get( const std::string &key ) const override;

        outcome::result<QueryResult> query( const std::string &keyPrefix ) const override;

        [[nodiscard]] bool contains( const std::string &key ) const override;

        outcome::result<void> put( const std::string &key, std::string value ) override;

        outcome::result<void> remove( const std::string &key ) override;

        std::string GetName() override
        {
            return "rocksdb";
        }

    private:
        std::shared_ptr<DB>      db_;
        ReadOptions              ro_;
        WriteOptions             wo_;
        base::Logger             logger_;
        std::shared_ptr<Options> options_;
    };

} // namespace fedsync::storage

#endif // FEDSYNC_ROCKSDB_HPP
