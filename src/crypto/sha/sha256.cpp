
#include "crypto/sha/sha256.hpp"

#include <openssl/evp.h>

namespace fedsync::crypto
{
    namespace
    {
        Hash256 digest( const void *data, size_t size )
        {
            Hash256      out{};
            unsigned int digest_len = 0;

            EVP_MD_CTX *ctx = EVP_MD_CTX_new();
            EVP_DigestInit_ex( ctx, EVP_sha256(), nullptr );
            EVP_DigestUpdate( ctx, data, size );
            EVP_DigestFinal_ex( ctx, out.data(), &digest_len );
            EVP_MD_CTX_free( ctx );

            return out;
        }
    }

    Hash256 sha256( std::string_view input )
    {
        return digest( input.data(), input.size() );
    }

    Hash256 sha256( const std::vector<uint8_t> &input )
    {
        return digest( input.data(), input.size() );
    }

    std::string sha256Hex( std::string_view input )
    {
        static constexpr char kHexChars[] = "0123456789abcdef";

        auto        hash = sha256( input );
        std::string out;
        out.reserve( hash.size() * 2 );
        for ( auto byte : hash )
        {
            out.push_back( kHexChars[byte >> 4] );
            out.push_back( kHexChars[byte & 0x0f] );
        }
        return out;
    }
} // namespace fedsync::crypto
