#include "config/config_reader_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( fedsync::config, ConfigReaderError, e )
{
    using E = fedsync::config::ConfigReaderError;
    switch ( e )
    {
        case E::MISSING_ENTRY:
            return "A required entry is missing in the provided config file";
        case E::PARSER_ERROR:
            return "Internal parser error";
        case E::INVALID_ENTRY:
            return "An entry of the provided config file has an invalid value";
        case E::UNSUPPORTED_ENTRY:
            return "An entry of the provided config file is not supported by this program";
    }
    return "Unknown error";
}
