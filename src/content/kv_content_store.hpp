/**
 * @file       kv_content_store.hpp
 * @brief      ContentStore persisted in a KeyValueStore
 */
#ifndef FEDSYNC_KV_CONTENT_STORE_HPP
#define FEDSYNC_KV_CONTENT_STORE_HPP

#include <map>
#include <mutex>
#include <shared_mutex>

#include "base/logger.hpp"
#include "content/content_store.hpp"
#include "storage/key_value_store.hpp"

namespace fedsync::content
{
    /**
     * @brief Stores every item as a protobuf record under /content/<id>.
     */
    class KvContentStore : public ContentStore, public std::enable_shared_from_this<KvContentStore>
    {
    public:
        static constexpr std::string_view CONTENT_PREFIX = "/content/";

        /**
         * @brief Create a store over @param db
         * @param policy optional check run before every Put and Delete
         */
        static std::shared_ptr<KvContentStore> New( std::shared_ptr<storage::KeyValueStore> db,
                                                    WritePolicy                             policy = nullptr );

        outcome::result<std::string> Put( const ContentItem &item ) override;

        outcome::result<void> Delete( const std::string &id ) override;

        outcome::result<ContentItem> Get( const std::string &id ) const override;

        bool Has( const std::string &id ) const override;

        outcome::result<std::vector<ContentItem>> Search( const ContentQuery &query ) const override;

        std::unique_ptr<ContentCursor> Iterate( const ContentQuery &query ) const override;

        ListenerId AddChangeListener( ChangeListener listener ) override;

        void RemoveChangeListener( ListenerId id ) override;

        void SetWritePolicy( WritePolicy policy );

        static std::string KeyFor( const std::string &id );

    private:
        class Cursor;

        KvContentStore( std::shared_ptr<storage::KeyValueStore> db, WritePolicy policy );

        bool IsAllowed( const ContentItem &item, bool isDelete ) const;

        void Notify( const std::vector<ContentItem> &added, const std::vector<ContentItem> &removed );

        std::shared_ptr<storage::KeyValueStore> db_;

        mutable std::shared_mutex policyMutex_;
        WritePolicy               policy_;

        std::mutex                           listenersMutex_;
        std::map<ListenerId, ChangeListener> listeners_;
        ListenerId                           nextListenerId_ = 1;

        base::Logger m_logger = base::createLogger( "ContentStore" );
    };
} // namespace fedsync::content

#endif // FEDSYNC_KV_CONTENT_STORE_HPP
