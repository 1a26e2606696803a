#ifndef DOCSHIELD_UTIL_HASHING_HPP
#define DOCSHIELD_UTIL_HASHING_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief Document fingerprinting for DocShield.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - A scanned document is identified by the SHA-256 of its raw bytes,
 *     hex-encoded in lowercase. The digest keys the scan history and is
 *     reported alongside every ScanResult.
 *
 * USAGE:
 *   @code
 *   std::string digest = docshield::util::hashing::sha256(bytes);
 *   @endcode
 */

namespace docshield {
namespace util {
namespace hashing {

inline std::string toHex(const unsigned char *data, size_t length)
{
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

/**
 * @class Sha256
 * @brief Incremental SHA-256 over an OpenSSL EVP context.
 * @throw std::runtime_error from any member if OpenSSL reports a failure.
 */
class Sha256 {
public:
    Sha256()
        : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
    {
        if (!ctx_) {
            throw std::runtime_error("hashing::Sha256: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("hashing::Sha256: EVP_DigestInit_ex failed");
        }
    }

    Sha256& update(const void *data, size_t size)
    {
        if (size > 0 && EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("hashing::Sha256: EVP_DigestUpdate failed");
        }
        return *this;
    }

    /// Lowercase hex digest. The object must not be updated afterwards.
    std::string hexDigest()
    {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
            throw std::runtime_error("hashing::Sha256: EVP_DigestFinal_ex failed");
        }
        return toHex(digest, length);
    }

private:
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX *)> ctx_;
};

inline std::string sha256(const std::vector<uint8_t> &input)
{
    return Sha256().update(input.data(), input.size()).hexDigest();
}

inline std::string sha256(const std::string &input)
{
    return Sha256().update(input.data(), input.size()).hexDigest();
}

} // namespace hashing
} // namespace util
} // namespace docshield

#endif // DOCSHIELD_UTIL_HASHING_HPP
