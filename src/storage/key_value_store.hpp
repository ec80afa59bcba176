
#ifndef FEDSYNC_KEY_VALUE_STORE_HPP
#define FEDSYNC_KEY_VALUE_STORE_HPP

#include <map>
#include <string>

#include "outcome/outcome.hpp"

namespace fedsync::storage
{
    /**
     * @brief An abstraction over a readable, writeable key-value map with
     * prefix queries. Keys are namespaced with '/' separated prefixes.
     */
    class KeyValueStore
    {
    public:
        using QueryResult = std::map<std::string, std::string>;

        virtual ~KeyValueStore() = default;

        /**
         * @brief Get value by key
         * @param key K
         * @return V, or DatabaseError::NOT_FOUND
         */
        virtual outcome::result<std::string> get( const std::string &key ) const = 0;

        /**
         * @brief Store value by key
         * @param key non-empty key
         * @param value value
         * @return result containing void if put successful, error otherwise
         */
        virtual outcome::result<void> put( const std::string &key, std::string value ) = 0;

        /**
         * @brief Returns true if given key-value binding exists in the storage.
         * @param key K
         * @return true if key has value, false if does not, or error at .
         */
        virtual bool contains( const std::string &key ) const = 0;

        /**
         * @brief Remove value by key
         * @param key K
         * @return error code if error happened
         */
        virtual outcome::result<void> remove( const std::string &key ) = 0;

        /**
         * @brief Every key-value pair whose key starts with @param keyPrefix
         */
        virtual outcome::result<QueryResult> query( const std::string &keyPrefix ) const = 0;

        virtual std::string GetName() = 0;
    };
} // namespace fedsync::storage

#endif // FEDSYNC_KEY_VALUE_STORE_HPP
