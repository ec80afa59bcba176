/**
 * @file       site_directory.hpp
 * @brief      Resolution of site addresses to their content collections
 */
#ifndef FEDSYNC_SITE_DIRECTORY_HPP
#define FEDSYNC_SITE_DIRECTORY_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "base/logger.hpp"
#include "content/content_store.hpp"
#include "federation/backoff.hpp"
#include "outcome/outcome.hpp"

namespace fedsync::federation
{
    /**
     * @brief Dialing boundary of the engine. Opening a site either observes
     * its live collection or opens a complete local replica of it.
     */
    class SiteDirectory
    {
    public:
        enum class OpenMode
        {
            Observe,
            Replicate,
        };

        enum class Error
        {
            SITE_UNREACHABLE = 1,
            OPEN_TIMEOUT,
        };

        virtual ~SiteDirectory() = default;

        /**
         * @brief Open the collection of @param address
         * @param mode observe the remote collection or replicate it locally
         * @param timeout bound of the whole open
         */
        virtual outcome::result<std::shared_ptr<content::ContentStore>> Open( const std::string        &address,
                                                                              OpenMode                  mode,
                                                                              std::chrono::milliseconds timeout ) = 0;

        /**
         * @brief Release what Open acquired. Unknown addresses are ignored.
         */
        virtual void Close( const std::string &address, OpenMode mode ) = 0;

        /**
         * @brief Open with up to @param backoff MaxAttempts() tries, sleeping the backoff delay in between
         * @return the last open failure, or errc::operation_canceled once @param token is cancelled
         */
        outcome::result<std::shared_ptr<content::ContentStore>> OpenWithRetry( const std::string        &address,
                                                                               OpenMode                  mode,
                                                                               std::chrono::milliseconds timeout,
                                                                               const Backoff            &backoff,
                                                                               const CancellationToken  &token );
    };

    /**
     * @brief Directory of sites hosted by the same process. Replicas are
     * full copies kept current by forwarding the source's change stream.
     */
    class InProcessSiteDirectory : public SiteDirectory
    {
    public:
        ~InProcessSiteDirectory() override;

        void Register( const std::string &address, std::shared_ptr<content::ContentStore> store );
        void Unregister( const std::string &address );

        outcome::result<std::shared_ptr<content::ContentStore>> Open( const std::string        &address,
                                                                      OpenMode                  mode,
                                                                      std::chrono::milliseconds timeout ) override;

        void Close( const std::string &address, OpenMode mode ) override;

        /**
         * @brief Number of replicas currently open
         */
        size_t ReplicaCount() const;

    private:
        struct Replica
        {
            std::shared_ptr<content::ContentStore> source;
            std::shared_ptr<content::ContentStore> copy;
            content::ContentStore::ListenerId      listener = 0;
            size_t                                 users    = 0;
        };

        outcome::result<std::shared_ptr<content::ContentStore>> OpenReplica( const std::string                            &address,
                                                                             const std::shared_ptr<content::ContentStore> &source );

        mutable std::mutex                                            mutex_;
        std::map<std::string, std::shared_ptr<content::ContentStore>> sites_;
        std::map<std::string, Replica>                                replicas_;

        base::Logger m_logger = base::createLogger( "SiteDirectory" );
    };
} // namespace fedsync::federation

OUTCOME_HPP_DECLARE_ERROR_2( fedsync::federation, SiteDirectory::Error );

#endif // FEDSYNC_SITE_DIRECTORY_HPP
