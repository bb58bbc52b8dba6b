#pragma once

#include <cstdint>
#include <string>

namespace fiscus {
namespace utils {

/**
 * @brief Salted PBKDF2-HMAC-SHA256 password hashes
 *
 * Encoded form: pbkdf2_sha256$<iterations>$<salt hex>$<hash hex>
 */
class PasswordHasher {
public:
    static constexpr uint32_t kDefaultIterations = 120000;
    static constexpr size_t kSaltBytes = 16;
    static constexpr size_t kHashBytes = 32;

    explicit PasswordHasher(uint32_t iterations = kDefaultIterations);

    /// Throws std::runtime_error when OpenSSL fails
    std::string hash(const std::string& password) const;

    /// Constant-time comparison; false for malformed encodings
    bool verify(const std::string& password, const std::string& encoded) const;

    uint32_t iterations() const { return iterations_; }

private:
    uint32_t iterations_;
};

} // namespace utils
} // namespace fiscus
