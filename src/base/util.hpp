/**
 * @file       util.hpp
 * @brief      Utilities functions header file
 */

#ifndef FEDSYNC_UTIL_HPP
#define FEDSYNC_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

namespace fedsync::base
{
    /// Milliseconds since the Unix epoch
    using TimestampMs = int64_t;

    /**
     * @brief       Current wall clock time
     * @return      Milliseconds since the Unix epoch
     */
    inline TimestampMs NowMillis()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch() )
            .count();
    }

    /**
     * @brief       Lowercase ASCII copy of a string
     * @param[in]   input Text to convert
     * @return      Lowercase string
     */
    inline std::string ToLower( std::string_view input )
    {
        std::string out( input );
        std::transform( out.begin(),
                        out.end(),
                        out.begin(),
                        []( unsigned char c ) { return static_cast<char>( std::tolower( c ) ); } );
        return out;
    }

    /**
     * @brief       Case insensitive substring search
     * @param[in]   haystack Text to search in
     * @param[in]   needle Text to look for
     * @return      true if needle is empty or found in haystack
     */
    inline bool ContainsIgnoreCase( std::string_view haystack, std::string_view needle )
    {
        if ( needle.empty() )
        {
            return true;
        }
        return ToLower( haystack ).find( ToLower( needle ) ) != std::string::npos;
    }

    /**
     * @brief       Poll a condition until it holds or the timeout elapses
     * @param[in]   condition Callable returning true once the wait is over
     * @param[in]   timeout Maximum time to wait
     * @param[out]  actualDuration Optional, receives the time actually waited
     * @param[in]   check_interval Sleep between two polls
     * @return      true if the condition was met in time
     */
    template <typename Condition>
    bool waitForCondition( Condition                  condition,
                           std::chrono::milliseconds  timeout,
                           std::chrono::milliseconds *actualDuration = nullptr,
                           std::chrono::milliseconds  check_interval = std::chrono::milliseconds( 10 ) )
    {
        auto start = std::chrono::steady_clock::now();
        bool met   = condition();
        while ( !met && std::chrono::steady_clock::now() - start < timeout )
        {
            std::this_thread::sleep_for( check_interval );
            met = condition();
        }
        if ( actualDuration != nullptr )
        {
            *actualDuration = std::chrono::duration_cast<std::chrono::milliseconds>( std::chrono::steady_clock::now() -
                                                                                     start );
        }
        return met;
    }
} // namespace fedsync::base

#endif // FEDSYNC_UTIL_HPP
