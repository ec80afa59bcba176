/**
 * @file       federation_config.hpp
 * @brief      JSON configuration of a federation node
 */
#ifndef FEDSYNC_FEDERATION_CONFIG_HPP
#define FEDSYNC_FEDERATION_CONFIG_HPP

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "federation/federation_options.hpp"
#include "outcome/outcome.hpp"

namespace fedsync::config
{
    /**
     * @brief Settings of one node. Everything under "federation" overrides
     * the matching FederationOptions default.
     */
    struct NodeConfig
    {
        std::string address;
        std::string name;
        std::string storagePath; ///< empty keeps everything in memory
        std::string logLevel = "info";

        uint16_t                 pubsubPort = 0; ///< 0 disables the gossip bus
        std::vector<std::string> pubsubBootstrap;

        federation::FederationOptions options;
    };

    /**
     * @brief Read the node configuration at @param path
     * @return MISSING_ENTRY without an address, PARSER_ERROR for malformed
     * JSON, INVALID_ENTRY for unknown transports or inconsistent options
     */
    outcome::result<NodeConfig> LoadFederationConfig( const std::string &path );

    outcome::result<NodeConfig> ParseFederationConfig( std::istream &input );

    /**
     * @brief Check that a node hosting only its own site can serve @param config.
     * Such a node reaches other sites over gossip alone, so only the
     * message-bus transport on a configured pubsub port works, and the
     * head state of followed sites is never readable.
     * @return UNSUPPORTED_ENTRY otherwise
     */
    outcome::result<void> CheckStandaloneNode( const NodeConfig &config );
} // namespace fedsync::config

#endif // FEDSYNC_FEDERATION_CONFIG_HPP
