#include "base/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace
{
    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    void setDebugPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S.%F][th:%t][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag,
                                                  bool               debug_mode = false,
                                                  const std::string &basepath   = "" )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( basepath.size() > 0 )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else
        {
            logger = spdlog::stdout_color_mt( tag );
        }

        if ( debug_mode )
        {
            setDebugPattern( *logger );
        }
        else
        {
            setGlobalPattern( *logger );
        }
        return logger;
    }
} // namespace

namespace fedsync::base
{
    Logger createLogger( const std::string &tag, const std::string &basepath )
    {
        static std::mutex           mutex;
        std::lock_guard<std::mutex> lock( mutex );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, false, basepath );
        }
        return logger;
    }

    bool setGlobalLevel( const std::string &level_name )
    {
        auto level = spdlog::level::from_str( level_name );
        if ( level == spdlog::level::off && level_name != "off" )
        {
            return false;
        }
        spdlog::set_level( level );
        if ( level <= spdlog::level::debug )
        {
            spdlog::apply_all( []( const std::shared_ptr<spdlog::logger> &logger ) { setDebugPattern( *logger ); } );
        }
        return true;
    }
} // namespace fedsync::base
