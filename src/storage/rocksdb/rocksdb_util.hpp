
#ifndef FEDSYNC_ROCKSDB_UTIL_HPP
#define FEDSYNC_ROCKSDB_UTIL_HPP

#include <rocksdb/slice.h>
#include <rocksdb/status.h>

#include "outcome/outcome.hpp"
#include "base/logger.hpp"
#include "storage/database_error.hpp"

namespace fedsync::storage
{
    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s )
    {
        if ( s.IsNotFound() )
        {
            return DatabaseError::NOT_FOUND;
        }

        if ( s.IsIOError() )
        {
            return DatabaseError::IO_ERROR;
        }

        if ( s.IsInvalidArgument() )
        {
            return DatabaseError::INVALID_ARGUMENT;
        }

        if ( s.IsCorruption() )
        {
            return DatabaseError::CORRUPTION;
        }

        if ( s.IsNotSupported() )
        {
            return DatabaseError::NOT_SUPPORTED;
        }

        return DatabaseError::UNKNOWN;
    }

    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s, const base::Logger &logger )
    {
        logger->error( s.ToString() );
        return error_as_result<T>( s );
    }

    inline ::ROCKSDB_NAMESPACE::Slice make_slice( const std::string &str )
    {
        return ::ROCKSDB_NAMESPACE::Slice{ str.data(), str.size() };
    }

} // namespace fedsync::storage

#endif // FEDSYNC_ROCKSDB_UTIL_HPP
