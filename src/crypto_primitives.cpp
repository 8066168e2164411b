#include "crypto_primitives.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace veil {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

// Upper bound handed to EVP_PBE_scrypt; covers N=2^15, r=8 with headroom.
constexpr uint64_t kScryptMaxMemory = 64ULL * 1024 * 1024;

}

std::string CryptoPrimitives::sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash) == nullptr) {
        throw CryptoError("SHA256 failed");
    }
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string CryptoPrimitives::hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             mac, &mac_len) == nullptr) {
        throw CryptoError("HMAC-SHA256 failed");
    }
    return to_hex(mac, mac_len);
}

std::string CryptoPrimitives::scrypt_hex(const std::string& password, const std::string& salt,
                                         const ScryptParams& params) {
    std::vector<unsigned char> key(params.key_length);
    if (EVP_PBE_scrypt(password.data(), password.size(),
                       reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
                       params.n, params.r, params.p, kScryptMaxMemory,
                       key.data(), key.size()) != 1) {
        throw CryptoError("scrypt derivation failed (N=" + std::to_string(params.n) + ")");
    }
    return to_hex(key.data(), key.size());
}

std::string CryptoPrimitives::random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw CryptoError("CSPRNG Failure - Entropy Exhausted");
    }
    return to_hex(buffer.data(), buffer.size());
}

std::string CryptoPrimitives::random_uuid_hex() {
    unsigned char buffer[16];
    if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
        throw CryptoError("CSPRNG Failure - Entropy Exhausted");
    }
    buffer[6] = static_cast<unsigned char>((buffer[6] & 0x0f) | 0x40);
    buffer[8] = static_cast<unsigned char>((buffer[8] & 0x3f) | 0x80);
    return to_hex(buffer, sizeof(buffer));
}

std::string CryptoPrimitives::blind(const std::string& input, const std::string& salt) {
    return sha256_hex(input + salt);
}

bool CryptoPrimitives::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

SaltSource::SaltSource(std::string current, std::optional<std::string> previous)
    : current_(std::move(current)), previous_(std::move(previous)) {}

std::string SaltSource::current() const {
    std::shared_lock lock(mutex_);
    return current_;
}

std::optional<std::string> SaltSource::previous() const {
    std::shared_lock lock(mutex_);
    return previous_;
}

void SaltSource::rotate(const std::string& next) {
    std::unique_lock lock(mutex_);
    previous_ = current_;
    current_ = next;
}

}
