/**
 * @file       full_mirror_transport.hpp
 * @brief      Complete local replica of a followed site
 */
#ifndef FEDSYNC_FULL_MIRROR_TRANSPORT_HPP
#define FEDSYNC_FULL_MIRROR_TRANSPORT_HPP

#include <map>
#include <memory>
#include <mutex>

#include "base/logger.hpp"
#include "federation/federation_options.hpp"
#include "federation/site_directory.hpp"
#include "federation/transport/transport.hpp"

namespace fedsync::federation
{
    /**
     * @brief Replicates the followed collection, delivers it in scan batches
     * once, then forwards the replica's change stream.
     */
    class FullMirrorTransport : public Transport, public std::enable_shared_from_this<FullMirrorTransport>
    {
    public:
        enum class Error
        {
            SELF_MIRROR = 1,
        };

        /**
         * @param localAddress address of this node, never mirrored
         * @param options scanBatchSize is the number of items per delivery of the initial scan
         */
        static std::shared_ptr<FullMirrorTransport> New( std::string                    localAddress,
                                                         std::shared_ptr<SiteDirectory> directory,
                                                         const FederationOptions       &options );

        ~FullMirrorTransport() override;

        TransportKind Kind() const override
        {
            return TransportKind::FullMirror;
        }

        outcome::result<void> Start( const FollowEdge &edge, std::chrono::milliseconds openTimeout ) override;
        void                  Stop( const std::string &edgeId ) override;

        outcome::result<std::vector<ContentItem>> Snapshot( const FollowEdge &edge, size_t limit ) override;

    private:
        struct Mirror
        {
            std::string                            address;
            std::shared_ptr<content::ContentStore> replica;
            content::ContentStore::ListenerId      listener = 0;
        };

        FullMirrorTransport( std::string                    localAddress,
                             std::shared_ptr<SiteDirectory> directory,
                             const FederationOptions       &options );

        /**
         * @brief Deliver the whole replica of @param edge in scan batches
         * @return number of items delivered
         */
        outcome::result<size_t> Scan( const FollowEdge &edge, const std::shared_ptr<content::ContentStore> &replica );

        void Release( Mirror &mirror );

        std::string                    localAddress_;
        std::shared_ptr<SiteDirectory> directory_;
        size_t                         scanBatchSize_;
        std::chrono::milliseconds      snapshotOpenTimeout_;
        Backoff                        snapshotBackoff_;
        std::mutex                     mutex_;
        std::map<std::string, Mirror>  mirrors_;

        base::Logger m_logger = base::createLogger( "FullMirrorTransport" );
    };
} // namespace fedsync::federation

OUTCOME_HPP_DECLARE_ERROR_2( fedsync::federation, FullMirrorTransport::Error );

#endif // FEDSYNC_FULL_MIRROR_TRANSPORT_HPP
