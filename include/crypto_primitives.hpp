#pragma once

#include <string>
#include <optional>
#include <shared_mutex>
#include <stdexcept>

namespace veil {

// Raised when an OpenSSL primitive (digest, MAC, KDF, CSPRNG) fails.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what) : std::runtime_error(what) {}
};

struct ScryptParams {
    unsigned long long n = 16384;
    unsigned long long r = 8;
    unsigned long long p = 1;
    size_t key_length = 32;
};

// Salted digests and memory-hard key derivation used for fingerprints,
// device tokens and region hashes. All outputs are lowercase hex.
class CryptoPrimitives {
public:
    static std::string sha256_hex(const std::string& data);

    static std::string hmac_sha256_hex(const std::string& key, const std::string& data);

    /**
     * Derives key_length bytes with scrypt (EVP_PBE_scrypt).
     * @throws CryptoError when the KDF is unavailable or the parameters are rejected.
     */
    static std::string scrypt_hex(const std::string& password, const std::string& salt,
                                  const ScryptParams& params);

    // Cryptographically random bytes, hex-encoded (2 * bytes characters).
    static std::string random_hex(size_t bytes);

    // 128-bit random identifier with RFC 4122 version/variant bits, 32 hex chars.
    static std::string random_uuid_hex();

    // Salted SHA-256 of an identifier, used for store keys and log subjects.
    static std::string blind(const std::string& input, const std::string& salt);

    static bool constant_time_equals(const std::string& a, const std::string& b);
};

// Holds the injected salt material. Rotation is scheduled by the owner of the
// configuration: rotate() demotes the current salt to previous.
class SaltSource {
public:
    explicit SaltSource(std::string current, std::optional<std::string> previous = std::nullopt);

    std::string current() const;
    std::optional<std::string> previous() const;

    void rotate(const std::string& next);

private:
    mutable std::shared_mutex mutex_;
    std::string current_;
    std::optional<std::string> previous_;
};

}
