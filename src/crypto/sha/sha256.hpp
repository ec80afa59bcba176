
#ifndef FEDSYNC_SHA256_HPP
#define FEDSYNC_SHA256_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fedsync::crypto
{
    using Hash256 = std::array<uint8_t, 32>;

    /**
     * Take a SHA-256 hash from string
     * @param input to be hashed
     * @return hashed bytes
     */
    Hash256 sha256( std::string_view input );

    /**
     * Take a SHA-256 hash from bytes
     * @param input to be hashed
     * @return hashed bytes
     */
    Hash256 sha256( const std::vector<uint8_t> &input );

    /**
     * @brief Lowercase hex rendering of a SHA-256 digest of @param input
     */
    std::string sha256Hex( std::string_view input );
} // namespace fedsync::crypto

#endif // FEDSYNC_SHA256_HPP
