/**
 * @file       realtime_transport.hpp
 * @brief      Live observation of a followed site's collection
 */
#ifndef FEDSYNC_REALTIME_TRANSPORT_HPP
#define FEDSYNC_REALTIME_TRANSPORT_HPP

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
     * @brief Opens the followed collection in observe mode and forwards its
     * change events as they happen.
     */
    class RealTimeTransport : public Transport, public std::enable_shared_from_this<RealTimeTransport>
    {
    public:
        static std::shared_ptr<RealTimeTransport> New( std::shared_ptr<SiteDirectory> directory,
                                                       const FederationOptions       &options );

        ~RealTimeTransport() override;

        TransportKind Kind() const override
        {
            return TransportKind::RealTime;
        }

        outcome::result<void> Start( const FollowEdge &edge, std::chrono::milliseconds openTimeout ) override;
        void                  Stop( const std::string &edgeId ) override;

        outcome::result<std::vector<ContentItem>> Snapshot( const FollowEdge &edge, size_t limit ) override;

    private:
        struct Observation
        {
            std::string                            address;
            std::shared_ptr<content::ContentStore> store;
            content::ContentStore::ListenerId      listener = 0;
        };

        RealTimeTransport( std::shared_ptr<SiteDirectory> directory, const FederationOptions &options );

        void Release( Observation &observation );

        std::shared_ptr<SiteDirectory>     directory_;
        std::chrono::milliseconds          snapshotOpenTimeout_;
        Backoff                            snapshotBackoff_;
        std::mutex                         mutex_;
        std::map<std::string, Observation> observations_;

        base::Logger m_logger = base::createLogger( "RealTimeTransport" );
    };
} // namespace fedsync::federation

#endif // FEDSYNC_REALTIME_TRANSPORT_HPP
