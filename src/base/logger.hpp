
#ifndef FEDSYNC_LOGGER_HPP
#define FEDSYNC_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace fedsync::base
{
    using Logger = std::shared_ptr<spdlog::logger>;

    /**
     * Provide logger object
     * @param tag - tagging name for identifying logger
     * @param basepath - optional file to log into instead of the console
     * @return logger object
     */
    Logger createLogger( const std::string &tag, const std::string &basepath = "" );

    /**
     * Apply a level name ("trace", "debug", "info", "warn", "error", "off") to every registered logger
     * @param level_name - spdlog level name
     * @return false if the name is not a known level
     */
    bool setGlobalLevel( const std::string &level_name );
} // namespace fedsync::base

#endif // FEDSYNC_LOGGER_HPP
