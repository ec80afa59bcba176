#ifndef FEDSYNC_CONFIG_PT_UTIL_HPP
#define FEDSYNC_CONFIG_PT_UTIL_HPP

#include <boost/optional.hpp>

#include "config/config_reader_error.hpp"

namespace fedsync::config
{
    template <typename T>
    outcome::result<std::decay_t<T>> ensure( boost::optional<T> opt_entry )
    {
        if ( !opt_entry )
        {
            return ConfigReaderError::MISSING_ENTRY;
        }
        return opt_entry.value();
    }
} // namespace fedsync::config

#endif // FEDSYNC_CONFIG_PT_UTIL_HPP
