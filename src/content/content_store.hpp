/**
 * @file       content_store.hpp
 * @brief      Interface to a site's replicated content collection
 */
#ifndef FEDSYNC_CONTENT_STORE_HPP
#define FEDSYNC_CONTENT_STORE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "federation/proto/federation.pb.h"

namespace fedsync::content
{
    using ContentItem = federation::pb::ContentItem;

    /**
     * @brief Selection over a content collection.
     */
    struct ContentQuery
    {
        using Predicate = std::function<bool( const ContentItem & )>;

        Predicate filter = nullptr; ///< empty means every item
        size_t    limit  = 0;       ///< 0 means unbounded

        bool Matches( const ContentItem &item ) const
        {
            return !filter || filter( item );
        }
    };

    /**
     * @brief Batched, forward only walk over a query result.
     */
    class ContentCursor
    {
    public:
        virtual ~ContentCursor() = default;

        /**
         * @brief Fetch up to @param batchSize more items
         * @return the items, empty once Done()
         */
        virtual outcome::result<std::vector<ContentItem>> Next( size_t batchSize ) = 0;

        virtual bool Done() const = 0;
    };

    /**
     * @brief Thin adapter over the external replicated collection of a site.
     * Implementations must be safe to call from several threads.
     */
    class ContentStore
    {
    public:
        using ChangeListener = std::function<void( const std::vector<ContentItem> &added,
                                                   const std::vector<ContentItem> &removed )>;
        using ListenerId     = uint64_t;
        using WritePolicy    = std::function<bool( const ContentItem &item, bool isDelete )>;

        enum class Error
        {
            NOT_FOUND = 1,
            WRITE_DENIED,
            INVALID_ITEM,
            CORRUPTED_RECORD,
        };

        virtual ~ContentStore() = default;

        /**
         * @brief Insert or replace an item
         * @return hash of the stored record
         */
        virtual outcome::result<std::string> Put( const ContentItem &item ) = 0;

        virtual outcome::result<void> Delete( const std::string &id ) = 0;

        virtual outcome::result<ContentItem> Get( const std::string &id ) const = 0;

        virtual bool Has( const std::string &id ) const = 0;

        virtual outcome::result<std::vector<ContentItem>> Search( const ContentQuery &query ) const = 0;

        virtual std::unique_ptr<ContentCursor> Iterate( const ContentQuery &query ) const = 0;

        /**
         * @brief Register a callback fired after every successful Put or Delete
         * @return handle for RemoveChangeListener
         */
        virtual ListenerId AddChangeListener( ChangeListener listener ) = 0;

        virtual void RemoveChangeListener( ListenerId id ) = 0;
    };
} // namespace fedsync::content

OUTCOME_HPP_DECLARE_ERROR_2( fedsync::content, ContentStore::Error );

#endif // FEDSYNC_CONTENT_STORE_HPP
