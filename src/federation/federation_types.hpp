/**
 * @file       federation_types.hpp
 * @brief      Shared federation vocabulary
 */
#ifndef FEDSYNC_FEDERATION_TYPES_HPP
#define FEDSYNC_FEDERATION_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "content/content_store.hpp"
#include "federation/proto/federation.pb.h"

namespace fedsync::federation
{
    using ContentItem          = pb::ContentItem;
    using FollowEdge           = pb::FollowEdge;
    using FederationIndexEntry = pb::FederationIndexEntry;

    /// Subscription type recorded on every edge created by an operator
    inline constexpr std::string_view DIRECT_SUBSCRIPTION = "direct";

    enum class SessionStatus
    {
        Connecting,
        Active,
        Degraded,
        Reconnecting,
        Failed,
    };

    inline const char *ToString( SessionStatus status )
    {
        switch ( status )
        {
            case SessionStatus::Connecting:
                return "Connecting";
            case SessionStatus::Active:
                return "Active";
            case SessionStatus::Degraded:
                return "Degraded";
            case SessionStatus::Reconnecting:
                return "Reconnecting";
            case SessionStatus::Failed:
                return "Failed";
        }
        return "Unknown";
    }

    /**
     * @brief Strategy used to discover and deliver a followed site's content
     */
    enum class TransportKind
    {
        RealTime,
        MessageBus,
        FullMirror,
    };

    inline const char *ToString( TransportKind kind )
    {
        switch ( kind )
        {
            case TransportKind::RealTime:
                return "realtime";
            case TransportKind::MessageBus:
                return "message-bus";
            case TransportKind::FullMirror:
                return "full-mirror";
        }
        return "unknown";
    }

    inline std::optional<TransportKind> ParseTransportKind( std::string_view name )
    {
        for ( auto kind : { TransportKind::RealTime, TransportKind::MessageBus, TransportKind::FullMirror } )
        {
            if ( name == ToString( kind ) )
            {
                return kind;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Outcome counters of one reconciliation pass
     */
    struct ReconcileResult
    {
        size_t imported = 0;
        size_t evicted  = 0;
        size_t skipped  = 0;
        size_t failed   = 0;

        std::vector<std::string> failedIds;

        ReconcileResult &operator+=( const ReconcileResult &rhs )
        {
            imported += rhs.imported;
            evicted += rhs.evicted;
            skipped += rhs.skipped;
            failed += rhs.failed;
            failedIds.insert( failedIds.end(), rhs.failedIds.begin(), rhs.failedIds.end() );
            return *this;
        }
    };

    /**
     * @brief Whether @param item is accepted by an edge's recursion rule
     */
    inline bool PassesRecursionRule( const FollowEdge &edge, const ContentItem &item )
    {
        return edge.recursive() || !item.has_federated_from() || item.federated_from().empty();
    }
} // namespace fedsync::federation

#endif // FEDSYNC_FEDERATION_TYPES_HPP
