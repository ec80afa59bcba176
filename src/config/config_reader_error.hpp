#ifndef FEDSYNC_CONFIG_READER_ERROR_HPP
#define FEDSYNC_CONFIG_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace fedsync::config
{
    /**
     * Codes for errors that originate in configuration readers
     */
    enum class ConfigReaderError
    {
        MISSING_ENTRY = 1,
        PARSER_ERROR,
        INVALID_ENTRY,
        UNSUPPORTED_ENTRY,
    };
} // namespace fedsync::config

OUTCOME_HPP_DECLARE_ERROR_2( fedsync::config, ConfigReaderError );

#endif // FEDSYNC_CONFIG_READER_ERROR_HPP
