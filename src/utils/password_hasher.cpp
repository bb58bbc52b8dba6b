#include "utils/password_hasher.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace fiscus {
namespace utils {

namespace {

constexpr const char* kScheme = "pbkdf2_sha256";

std::string toHex(const std::vector<unsigned char>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

bool fromHex(const std::string& hex, std::vector<unsigned char>& out) {
    if (hex.size() % 2 != 0) return false;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return true;
}

std::vector<unsigned char> derive(const std::string& password,
                                  const std::vector<unsigned char>& salt,
                                  uint32_t iterations,
                                  size_t length) {
    std::vector<unsigned char> out(length);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return out;
}

} // namespace

PasswordHasher::PasswordHasher(uint32_t iterations)
    : iterations_(iterations == 0 ? 1 : iterations) {}

std::string PasswordHasher::hash(const std::string& password) const {
    std::vector<unsigned char> salt(kSaltBytes);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("Failed to generate password salt");
    }
    auto digest = derive(password, salt, iterations_, kHashBytes);
    return std::string(kScheme) + "$" + std::to_string(iterations_) + "$" + toHex(salt) + "$" + toHex(digest);
}

bool PasswordHasher::verify(const std::string& password, const std::string& encoded) const {
    const size_t p1 = encoded.find('$');
    const size_t p2 = p1 == std::string::npos ? p1 : encoded.find('$', p1 + 1);
    const size_t p3 = p2 == std::string::npos ? p2 : encoded.find('$', p2 + 1);
    if (p3 == std::string::npos || encoded.substr(0, p1) != kScheme) {
        return false;
    }

    uint32_t iterations = 0;
    try {
        iterations = static_cast<uint32_t>(std::stoul(encoded.substr(p1 + 1, p2 - p1 - 1)));
    } catch (const std::exception&) {
        return false;
    }
    std::vector<unsigned char> salt, expected;
    if (iterations == 0 || !fromHex(encoded.substr(p2 + 1, p3 - p2 - 1), salt) ||
        !fromHex(encoded.substr(p3 + 1), expected) || expected.empty()) {
        return false;
    }

    auto actual = derive(password, salt, iterations, expected.size());
    return CRYPTO_memcmp(actual.data(), expected.data(), expected.size()) == 0;
}

} // namespace utils
} // namespace fiscus
