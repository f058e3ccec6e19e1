#ifndef VBAUNLOCK_CRYPTO_ERROR_HPP
#define VBAUNLOCK_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vbaunlock::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

// OpenSSL refused to create, initialise or finalise a digest
class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

// Salt supplied to a scheme that has none, or of the wrong size
class SaltError : public CryptoError {
public:
    explicit SaltError(const std::string& message) 
        : CryptoError("Salt error: " + message) {}
};

} // namespace vbaunlock::crypto

#endif // VBAUNLOCK_CRYPTO_ERROR_HPP
