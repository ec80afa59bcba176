#include <memory>
#include <utility>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>

#include "storage/rocksdb/rocksdb.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"

namespace fedsync::storage
{
    using BlockBasedTableOptions = ::ROCKSDB_NAMESPACE::BlockBasedTableOptions;

    rocksdb::~rocksdb() {}

    outcome::result<std::shared_ptr<rocksdb>> rocksdb::create( std::string_view path, const Options &options )
    {
        auto l = std::make_shared<rocksdb>();

        l->options_ = std::make_shared<Options>( options );

        BlockBasedTableOptions table_options;
        table_options.filter_policy.reset( ::ROCKSDB_NAMESPACE::NewBloomFilterPolicy( 10, false ) );
        table_options.whole_key_filtering = true;
        l->options_->table_factory.reset( NewBlockBasedTableFactory( table_options ) );
        l->options_->info_log_level = ::ROCKSDB_NAMESPACE::InfoLogLevel::ERROR_LEVEL;

        DB  *db     = nullptr;
        auto status = DB::Open( *( l->options_ ), std::string( path ), &db );

        if ( status.ok() )
        {
            l->db_     = std::shared_ptr<DB>( db );
            l->logger_ = base::createLogger( "rocksdb" );
            WriteOptions write_options;
            write_options.sync = true;
            l->setWriteOptions( write_options );
            return l;
        }

        if ( db )
        {
            delete db;
        }

        return error_as_result<std::shared_ptr<rocksdb>>( status );
    }

    void rocksdb::setWriteOptions( WriteOptions wo )
    {
        wo_ = wo;
    }

    outcome::result<std::string> rocksdb::get( const std::string &key ) const
    {
        std::string value;
        auto        status = db_->Get( ro_, make_slice( key ), &value );
        if ( status.ok() )
        {
            return value;
        }

        // not always an actual error so don't log it
        if ( status.IsNotFound() )
        {
            return error_as_result<std::string>( status );
        }

        return error_as_result<std::string>( status, logger_ );
    }

    outcome::result<KeyValueStore::QueryResult> rocksdb::query( const std::string &keyPrefix ) const
    {
        QueryResult results;
        auto        iter        = std::unique_ptr<Iterator>( db_->NewIterator( ro_ ) );
        auto        slicePrefix = make_slice( keyPrefix );
        for ( iter->Seek( slicePrefix ); iter->Valid() && iter->key().starts_with( slicePrefix ); iter->Next() )
        {
            results.emplace( iter->key().ToString(), iter->value().ToString() );
        }
        if ( !iter->status().ok() )
        {
            return error_as_result<QueryResult>( iter->status(), logger_ );
        }
        return results;
    }

    bool rocksdb::contains( const std::string &key ) const
    {
        // here we interpret all kinds of errors as "not found".
        return get( key ).has_value();
    }

    outcome::result<void> rocksdb::put( const std::string &key, std::string value )
    {
        auto status = db_->Put( wo_, make_slice( key ), make_slice( value ) );
        if ( status.ok() )
        {
            return outcome::success();
        }

        return error_as_result<void>( status, logger_ );
    }

    outcome::result<void> rocksdb::remove( const std::string &key )
    {
        auto status = db_->Delete( wo_, make_slice( key ) );
        if ( status.ok() )
        {
            return outcome::success();
        }

        return error_as_result<void>( status, logger_ );
    }

} // namespace fedsync::storage
